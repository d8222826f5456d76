#include "domain/events/SessionKeyLimitsUpdatedEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string SessionKeyLimitsUpdatedEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["keyId"] = keyId;
    j["oldSpendingLimit"] = toString(oldSpendingLimit);
    j["oldDailyLimit"] = toString(oldDailyLimit);
    j["newSpendingLimit"] = toString(newSpendingLimit);
    j["newDailyLimit"] = toString(newDailyLimit);
    j["usedToday"] = toString(usedToday);
    j["version"] = version;
    return j.dump();
}

} // namespace sessionkeys::domain
