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
 * @brief POST /api/v1/session-keys/authorize - авторизация со списанием
 *
 * Body: { "account_id", "key_id", "target", "value" }
 *
 * 200 при успехе, 403 с reason/limit/attempted при отказе.
 * Не идемпотентен: повтор успешного запроса списывает бюджет ещё раз.
 */
class AuthorizeHandler : public IHttpHandler {
public:
    AuthorizeHandler(
        std::shared_ptr<ports::input::ISessionKeyService> service,
        std::shared_ptr<ports::output::IClock> clock
    ) : service_(std::move(service))
      , clock_(std::move(clock))
    {
        std::cout << "[AuthorizeHandler] Created" << std::endl;
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
            auto target = requireString(body, "target");
            auto value = requireAmount(body, "value");

            auto decision = service_->authorize(accountId, keyId, target, value, clock_->now());
            sendJson(res, decision.allowed ? 200 : 403, decisionToJson(decision));

        } catch (const std::exception& e) {
            sendException(res, "AuthorizeHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessionkeys::adapters::primary
