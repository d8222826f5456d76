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
 * @brief POST /api/v1/session-keys - выдать сессионный ключ
 *
 * Body:
 * {
 *   "account_id": "0xabc...",
 *   "key_id": "0xdef...",
 *   "spending_limit": "100000000000000000",
 *   "daily_limit": "1000000000000000000",
 *   "expiry_time": 1767225600,
 *   "allowed_targets": ["0x123..."]      // необязательно, пусто = любой адресат
 * }
 */
class GrantSessionKeyHandler : public IHttpHandler {
public:
    GrantSessionKeyHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[GrantSessionKeyHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::GrantRequest request;
            request.accountId = requireString(body, "account_id");
            request.keyId = requireString(body, "key_id");
            request.spendingLimit = requireAmount(body, "spending_limit");
            request.dailyLimit = requireAmount(body, "daily_limit");
            request.expiryTime = requireTime(body, "expiry_time");
            if (body.contains("allowed_targets")) {
                request.allowedTargets = body["allowed_targets"].get<std::vector<std::string>>();
            }

            auto result = service_->grant(request, clock_->now());
            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }

            sendJson(res, 201, sessionKeyToJson(*result.sessionKey));

        } catch (const std::exception& e) {
            sendException(res, "GrantSessionKeyHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
