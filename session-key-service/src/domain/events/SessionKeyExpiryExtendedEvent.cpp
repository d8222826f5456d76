#include "domain/events/SessionKeyExpiryExtendedEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string SessionKeyExpiryExtendedEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["keyId"] = keyId;
    j["oldExpiryTime"] = oldExpiryTime;
    j["newExpiryTime"] = newExpiryTime;
    j["version"] = version;
    return j.dump();
}

} // namespace sessionkeys::domain
