// include/application/events/SessionKeyEventFactory.hpp
#pragma once

#include "domain/events/DomainEventFactory.hpp"
#include "domain/events/SessionKeyGrantedEvent.hpp"
#include "domain/events/SessionKeyRevokedEvent.hpp"
#include "domain/events/SessionKeyLimitsUpdatedEvent.hpp"
#include "domain/events/SessionKeyExpiryExtendedEvent.hpp"
#include "domain/events/EmergencyRevokeAllEvent.hpp"
#include "domain/events/SessionKeyUsedEvent.hpp"
#include <unordered_map>
#include <functional>
#include <stdexcept>

namespace sessionkeys::application {

/**
 * @brief Фабрика событий аудита с авторегистрацией
 *
 * Восстанавливает событие по routing key и JSON-телу.
 * При добавлении нового события - добавить в registerAllEvents().
 */
class SessionKeyEventFactory final : public domain::DomainEventFactory {
public:
    using Creator = std::function<std::unique_ptr<domain::DomainEvent>(const std::string&)>;

    SessionKeyEventFactory() {
        registerAllEvents();
    }

    /**
     * @brief Создать событие по типу и JSON
     * @throws std::runtime_error для незарегистрированного типа
     */
    std::unique_ptr<domain::DomainEvent> create(
        const std::string& eventType,
        const std::string& payloadJson
    ) const override {
        auto it = creators_.find(eventType);
        if (it == creators_.end()) {
            throw std::runtime_error("Unknown domain event type: " + eventType);
        }
        return it->second(payloadJson);
    }

    bool supports(const std::string& eventType) const {
        return creators_.count(eventType) > 0;
    }

private:
    void registerEvent(const std::string& eventType, Creator creator) {
        creators_[eventType] = std::move(creator);
    }

    void registerAllEvents() {
        registerEvent("session_key.granted", [](const std::string& json) {
            return std::make_unique<domain::SessionKeyGrantedEvent>(json);
        });

        registerEvent("session_key.revoked", [](const std::string& json) {
            return std::make_unique<domain::SessionKeyRevokedEvent>(json);
        });

        registerEvent("session_key.limits_updated", [](const std::string& json) {
            return std::make_unique<domain::SessionKeyLimitsUpdatedEvent>(json);
        });

        registerEvent("session_key.expiry_extended", [](const std::string& json) {
            return std::make_unique<domain::SessionKeyExpiryExtendedEvent>(json);
        });

        registerEvent("session_key.emergency_revoke_all", [](const std::string& json) {
            return std::make_unique<domain::EmergencyRevokeAllEvent>(json);
        });

        registerEvent("session_key.used", [](const std::string& json) {
            return std::make_unique<domain::SessionKeyUsedEvent>(json);
        });
    }

    std::unordered_map<std::string, Creator> creators_;
};

} // namespace sessionkeys::application
