#pragma once

#include <string>

namespace sessionkeys::ports::output {

/**
 * @brief Интерфейс для публикации событий аудита
 *
 * Реализуется RabbitMQEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (тип события, например "session_key.used")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace sessionkeys::ports::output
