// include/domain/events/SessionKeyUsedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "EventJson.hpp"
#include "domain/Amount.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Событие: операция авторизована и расход учтён
 */
struct SessionKeyUsedEvent : public DomainEvent {
    std::string accountId;
    std::string keyId;
    std::string target;
    Amount value;
    Amount usedToday;           ///< Расход за сутки после этой операции
    Amount dailyLimit;
    std::int64_t dayIndex = 0;
    std::uint64_t version = 0;

    explicit SessionKeyUsedEvent(Timestamp occurredAt) : DomainEvent("session_key.used", occurredAt) {}

    explicit SessionKeyUsedEvent(const std::string& json)
        : DomainEvent("session_key.used", Timestamp())
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);
        readBaseFields(*this, j);

        accountId = j.value("accountId", "");
        keyId = j.value("keyId", "");
        target = j.value("target", "");
        value = readAmount(j, "value");
        usedToday = readAmount(j, "usedToday");
        dailyLimit = readAmount(j, "dailyLimit");
        dayIndex = j.value("dayIndex", std::int64_t{0});
        version = j.value("version", std::uint64_t{0});
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SessionKeyUsedEvent>(*this);
    }
};

} // namespace sessionkeys::domain
