#include "domain/events/EmergencyRevokeAllEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string EmergencyRevokeAllEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["revokedCount"] = revokedCount;
    j["revokedKeys"] = revokedKeys;
    j["failedKeys"] = failedKeys;
    return j.dump();
}

} // namespace sessionkeys::domain
