// include/domain/events/SessionKeyRevokedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: сессионный ключ отозван
 *
 * Публикуется только при переходе active -> inactive.
 */
struct SessionKeyRevokedEvent : public DomainEvent {
    std::string accountId;
    std::string keyId;
    std::uint64_t version = 0;

    explicit SessionKeyRevokedEvent(Timestamp occurredAt) : DomainEvent("session_key.revoked", occurredAt) {}

    explicit SessionKeyRevokedEvent(const std::string& json)
        : DomainEvent("session_key.revoked", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        keyId = j.value("keyId", "");
        version = j.value("version", std::uint64_t{0});
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SessionKeyRevokedEvent>(*this);
    }
};

} // namespace sessionkeys::domain
