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
 * @brief POST /api/v1/session-keys/limits - изменить лимиты ключа
 *
 * Body: { "account_id", "key_id", "spending_limit", "daily_limit" }
 */
class UpdateLimitsHandler : public IHttpHandler {
public:
    UpdateLimitsHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[UpdateLimitsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            auto accountId = requireString(body, "account_id");
            auto keyId = requireString(body, "key_id");
            auto spendingLimit = requireAmount(body, "spending_limit");
            auto dailyLimit = requireAmount(body, "daily_limit");

            auto result = service_->updateLimits(accountId, keyId, spendingLimit, dailyLimit, clock_->now());
            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }

            sendJson(res, 200, sessionKeyToJson(*result.sessionKey));

        } catch (const std::exception& e) {
            sendException(res, "UpdateLimitsHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
