#pragma once

#include "DomainEvent.hpp"
#include "domain/Amount.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sessionkeys::domain {

// Общие поля событий в JSON. Суммы пишутся десятичной строкой:
// 256-битные значения не помещаются в число JSON.

inline void writeBaseFields(const DomainEvent& event, nlohmann::json& j) {
    j["eventId"] = event.eventId;
    j["eventType"] = event.eventType;
    j["timestamp"] = event.timestamp.toString();
    j["occurredAt"] = event.timestamp.seconds;
}

inline void readBaseFields(DomainEvent& event, const nlohmann::json& j) {
    event.eventId = j.value("eventId", event.eventId);
    if (j.contains("occurredAt")) {
        event.timestamp = Timestamp(j["occurredAt"].get<UnixTime>());
    }
}

inline Amount readAmount(const nlohmann::json& j, const char* field) {
    return parseAmount(j.value(field, std::string("0")));
}

} // namespace sessionkeys::domain
