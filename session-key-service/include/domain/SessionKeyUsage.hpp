#pragma once

#include "domain/Amount.hpp"
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Статистика использования ключа на момент запроса
 *
 * usedToday считается после виртуального сброса суток; хранимая запись
 * при этом не меняется.
 */
struct SessionKeyUsage {
    Amount usedToday;
    Amount remainingDaily;      ///< dailyLimit - usedToday
    Amount remainingPerTx;      ///< spendingLimit
    std::int64_t timeUntilExpiry = 0;  ///< max(0, expiryTime - now), секунды
};

} // namespace sessionkeys::domain
