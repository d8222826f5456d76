#pragma once

#include <stdexcept>
#include <string>

namespace sessionkeys::domain {

/**
 * @brief Нарушен внутренний инвариант записи
 *
 * Фатальная ситуация, отличная от отказа политики: сигнализирует
 * о дефекте проверки на границе реестра.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error("Invariant violation: " + message) {}
};

/**
 * @brief Исчерпаны попытки фиксации при конфликте версий записи
 */
class ConcurrentModificationError : public std::runtime_error {
public:
    explicit ConcurrentModificationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sessionkeys::domain
