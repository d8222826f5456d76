// include/domain/events/SessionKeyExpiryExtendedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: срок действия ключа продлён
 */
struct SessionKeyExpiryExtendedEvent : public DomainEvent {
    std::string accountId;
    std::string keyId;
    UnixTime oldExpiryTime = 0;
    UnixTime newExpiryTime = 0;
    std::uint64_t version = 0;

    explicit SessionKeyExpiryExtendedEvent(Timestamp occurredAt) : DomainEvent("session_key.expiry_extended", occurredAt) {}

    explicit SessionKeyExpiryExtendedEvent(const std::string& json)
        : DomainEvent("session_key.expiry_extended", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        keyId = j.value("keyId", "");
        oldExpiryTime = j.value("oldExpiryTime", UnixTime{0});
        newExpiryTime = j.value("newExpiryTime", UnixTime{0});
        version = j.value("version", std::uint64_t{0});
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SessionKeyExpiryExtendedEvent>(*this);
    }
};

} // namespace sessionkeys::domain
