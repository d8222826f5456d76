#pragma once

#include "domain/Timestamp.hpp"

namespace sessionkeys::ports::output {

/**
 * @brief Доверенный источник текущего времени
 *
 * Сервис никогда не читает часы сам: "now" приходит от вызывающего.
 * HTTP-адаптер берёт его отсюда.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::UnixTime now() const = 0;
};

} // namespace sessionkeys::ports::output
