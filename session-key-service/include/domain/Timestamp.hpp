#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace sessionkeys::domain {

/// Секунды с начала эпохи (UTC). Всегда передаётся вызывающей стороной.
using UnixTime = std::int64_t;

/// Длина суточного окна лимита
constexpr std::int64_t kSecondsPerDay = 86400;

/**
 * @brief Номер суток с начала эпохи: floor(now / 86400)
 *
 * Окно привязано к UTC-полуночи, а не к локальному времени аккаунта.
 * Для отрицательных значений округление идёт вниз, а не к нулю.
 */
inline std::int64_t dayIndex(UnixTime now) {
    std::int64_t day = now / kSecondsPerDay;
    if (now % kSecondsPerDay < 0) {
        --day;
    }
    return day;
}

/**
 * @brief Временная метка события
 */
class Timestamp {
public:
    UnixTime seconds = 0;

    Timestamp() = default;

    explicit Timestamp(UnixTime unixSeconds) : seconds(unixSeconds) {}

    std::string toString() const {
        auto time_t_val = static_cast<std::time_t>(seconds);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return seconds < other.seconds;
    }

    bool operator==(const Timestamp& other) const {
        return seconds == other.seconds;
    }
};

} // namespace sessionkeys::domain
