#include "domain/events/SessionKeyGrantedEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string SessionKeyGrantedEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["keyId"] = keyId;
    j["spendingLimit"] = toString(spendingLimit);
    j["dailyLimit"] = toString(dailyLimit);
    j["expiryTime"] = expiryTime;
    j["allowedTargets"] = allowedTargets;
    j["version"] = version;
    return j.dump();
}

} // namespace sessionkeys::domain
