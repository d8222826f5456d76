// include/domain/events/SessionKeyGrantedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include "domain/Amount.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <set>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: сессионный ключ выдан
 *
 * Несёт все лимиты записи для аудита.
 */
struct SessionKeyGrantedEvent : public DomainEvent {
    std::string accountId;
    std::string keyId;
    Amount spendingLimit;
    Amount dailyLimit;
    UnixTime expiryTime = 0;
    std::set<std::string> allowedTargets;
    std::uint64_t version = 0;

    explicit SessionKeyGrantedEvent(Timestamp occurredAt) : DomainEvent("session_key.granted", occurredAt) {}

    /// JSON конструктор для потребителей аудита
    explicit SessionKeyGrantedEvent(const std::string& json)
        : DomainEvent("session_key.granted", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        keyId = j.value("keyId", "");
        spendingLimit = readAmount(j, "spendingLimit");
        dailyLimit = readAmount(j, "dailyLimit");
        expiryTime = j.value("expiryTime", UnixTime{0});
        version = j.value("version", std::uint64_t{0});

        if (j.contains("allowedTargets")) {
            for (const auto& target : j["allowedTargets"]) {
                allowedTargets.insert(target.get<std::string>());
            }
        }
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SessionKeyGrantedEvent>(*this);
    }
};

} // namespace sessionkeys::domain
