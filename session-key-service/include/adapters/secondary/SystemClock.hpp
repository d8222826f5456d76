#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace sessionkeys::adapters::secondary {

/**
 * @brief Системные часы UTC
 */
class SystemClock : public ports::output::IClock {
public:
    domain::UnixTime now() const override {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::seconds>(since).count();
    }
};

} // namespace sessionkeys::adapters::secondary
