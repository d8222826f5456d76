// include/domain/events/SessionKeyLimitsUpdatedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include "domain/Amount.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: лимиты ключа изменены
 */
struct SessionKeyLimitsUpdatedEvent : public DomainEvent {
    std::string accountId;
    std::string keyId;
    Amount oldSpendingLimit;
    Amount oldDailyLimit;
    Amount newSpendingLimit;
    Amount newDailyLimit;
    Amount usedToday;           ///< После возможного усечения до нового дневного лимита
    std::uint64_t version = 0;

    explicit SessionKeyLimitsUpdatedEvent(Timestamp occurredAt) : DomainEvent("session_key.limits_updated", occurredAt) {}

    explicit SessionKeyLimitsUpdatedEvent(const std::string& json)
        : DomainEvent("session_key.limits_updated", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        keyId = j.value("keyId", "");
        oldSpendingLimit = readAmount(j, "oldSpendingLimit");
        oldDailyLimit = readAmount(j, "oldDailyLimit");
        newSpendingLimit = readAmount(j, "newSpendingLimit");
        newDailyLimit = readAmount(j, "newDailyLimit");
        usedToday = readAmount(j, "usedToday");
        version = j.value("version", std::uint64_t{0});
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SessionKeyLimitsUpdatedEvent>(*this);
    }
};

} // namespace sessionkeys::domain
