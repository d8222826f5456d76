// include/domain/events/EmergencyRevokeAllEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: аварийный отзыв всех ключей аккаунта
 *
 * Одно агрегированное событие на вызов, без событий по каждому ключу.
 * failedKeys - активные ключи, которые отозвать не удалось.
 */
struct EmergencyRevokeAllEvent : public DomainEvent {
    std::string accountId;
    std::uint64_t revokedCount = 0;
    std::vector<std::string> revokedKeys;
    std::vector<std::string> failedKeys;

    explicit EmergencyRevokeAllEvent(Timestamp occurredAt) : DomainEvent("session_key.emergency_revoke_all", occurredAt) {}

    explicit EmergencyRevokeAllEvent(const std::string& json)
        : DomainEvent("session_key.emergency_revoke_all", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        revokedCount = j.value("revokedCount", std::uint64_t{0});
        if (j.contains("revokedKeys")) {
            revokedKeys = j["revokedKeys"].get<std::vector<std::string>>();
        }
        if (j.contains("failedKeys")) {
            failedKeys = j["failedKeys"].get<std::vector<std::string>>();
        }
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<EmergencyRevokeAllEvent>(*this);
    }
};

} // namespace sessionkeys::domain
