#include "domain/events/SessionKeyRevokedEvent.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::domain {

std::string SessionKeyRevokedEvent::toJson() const {
    nlohmann::json j;
    writeBaseFields(*this, j);
    j["accountId"] = accountId;
    j["keyId"] = keyId;
    j["version"] = version;
    return j.dump();
}

} // namespace sessionkeys::domain
