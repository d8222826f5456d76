#pragma once

#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <string>
#include <memory>

namespace sessionkeys::domain {

/**
 * @brief Базовый класс событий аудита
 *
 * eventType совпадает с routing key при публикации
 * (session_key.granted, session_key.used, ...).
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события
    Timestamp timestamp;        ///< Момент мутации

    /**
     * @param type Тип события
     * @param occurredAt Момент мутации, переданный вызывающей стороной
     */
    DomainEvent(const std::string& type, Timestamp occurredAt)
        : eventId(utils::UuidGenerator::generate()), eventType(type), timestamp(occurredAt) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace sessionkeys::domain
