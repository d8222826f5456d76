#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/SessionKeyJson.hpp"
#include "ports/input/ISessionKeyService.hpp"
#include "ports/output/IClock.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace sessionkeys::adapters::primary {

/**
 * @brief POST /api/v1/session-keys/revoke-all - аварийный отзыв всех ключей
 *
 * Body: { "account_id" }
 *
 * Частичный отзыв отвечает 500 с revoked_keys и failed_keys.
 */
class EmergencyRevokeAllHandler : public IHttpHandler {
public:
    EmergencyRevokeAllHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[EmergencyRevokeAllHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            auto accountId = requireString(body, "account_id");

            auto result = service_->emergencyRevokeAll(accountId, clock_->now());
            if (!result.success && result.error != domain::ErrorCode::REVOKE_INCOMPLETE) {
                sendError(res, result.error, result.message);
                return;
            }

            nlohmann::json response;
            response["account_id"] = accountId;
            response["revoked_count"] = result.revokedCount;
            response["revoked_keys"] = result.revokedKeys;
            if (!result.success) {
                response["error"] = result.message;
                response["code"] = domain::toString(result.error);
                response["failed_keys"] = result.failedKeys;
                sendJson(res, 500, response);
                return;
            }
            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            sendException(res, "EmergencyRevokeAllHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
