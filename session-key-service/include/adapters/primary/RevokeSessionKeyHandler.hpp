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
 * @brief DELETE /api/v1/session-keys/{keyId}?account_id=... - отозвать ключ
 *
 * Роутер регистрирует с паттерном "/api/v1/session-keys/*".
 * Повторный отзыв отвечает 200 с revoked=false.
 */
class RevokeSessionKeyHandler : public IHttpHandler {
public:
    RevokeSessionKeyHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[RevokeSessionKeyHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "DELETE") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string keyId = req.getPathParam(0).value_or("");
        if (keyId.empty()) {
            sendError(res, 400, "Session key ID is required");
            return;
        }

        auto accountId = req.getQueryParam("account_id").value_or("");
        if (accountId.empty()) {
            sendError(res, 400, "account_id is required");
            return;
        }

        try {
            auto result = service_->revoke(accountId, keyId, clock_->now());
            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }

            nlohmann::json response;
            response["message"] = result.message;
            response["account_id"] = accountId;
            response["key_id"] = keyId;
            response["revoked"] = result.changed;
            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            sendException(res, "RevokeSessionKeyHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
