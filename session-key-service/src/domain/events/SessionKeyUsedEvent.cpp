#include "domain/events/SessionKeyUsedEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string SessionKeyUsedEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["keyId"] = keyId;
    j["target"] = target;
    j["value"] = toString(value);
    j["usedToday"] = toString(usedToday);
    j["dailyLimit"] = toString(dailyLimit);
    j["dayIndex"] = dayIndex;
    j["version"] = version;
    return j.dump();
}

} // namespace sessionkeys::domain
