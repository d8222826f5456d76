#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/SessionKeyJson.hpp"
#include "ports/input/ISessionKeyService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace sessionkeys::adapters::primary {

/**
 * @brief GET /api/v1/session-keys?account_id=... - активные ключи аккаунта
 *
 * С all=true возвращает все записи, включая отозванные.
 */
class ListSessionKeysHandler : public IHttpHandler {
public:
    explicit ListSessionKeysHandler(std::shared_ptr<ports::input::ISessionKeyService> service)
        : service_(std::move(service))
    {
        std::cout << "[ListSessionKeysHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto accountId = req.getQueryParam("account_id").value_or("");
        if (accountId.empty()) {
            sendError(res, 400, "account_id is required");
            return;
        }

        try {
            nlohmann::json response;
            response["account_id"] = accountId;

            if (req.getQueryParam("all").value_or("") == "true") {
                nlohmann::json keys = nlohmann::json::array();
                for (const auto& key : service_->listAll(accountId)) {
                    keys.push_back(sessionKeyToJson(key));
                }
                response["session_keys"] = keys;
            } else {
                response["active_keys"] = service_->listActive(accountId);
            }

            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            sendException(res, "ListSessionKeysHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
};

} // namespace sessionkeys::adapters::primary
