#pragma once

#include <IHttpHandler.hpp>
#include "application/SessionKeyService.hpp"
#include <nlohmann/json.hpp>

namespace sessionkeys::adapters::primary {

/**
 * @brief Health check handler
 *
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "session-key-service";
        response["module"] = application::SessionKeyService::kModuleName;
        response["version"] = application::SessionKeyService::kModuleVersion;

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }
};

} // namespace sessionkeys::adapters::primary
