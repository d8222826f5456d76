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
 * @brief POST /api/v1/session-keys/usage - статистика расхода ключа
 *
 * Body: { "account_id", "key_id" }
 */
class GetUsageHandler : public IHttpHandler {
public:
    GetUsageHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[GetUsageHandler] Created" << std::endl;
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

            auto result = service_->getUsage(accountId, keyId, clock_->now());
            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }

            auto response = usageToJson(*result.usage);
            response["account_id"] = accountId;
            response["key_id"] = keyId;
            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            sendException(res, "GetUsageHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
