#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/SessionKeyJson.hpp"
#include "ports/input/ISessionKeyService.hpp"
#include <memory>
#include <iostream>

namespace sessionkeys::adapters::primary {

/**
 * @brief GET /api/v1/session-keys/{keyId}?account_id=... - запись ключа
 *
 * Роутер регистрирует с паттерном "/api/v1/session-keys/*"
 */
class GetSessionKeyHandler : public IHttpHandler {
public:
    explicit GetSessionKeyHandler(std::shared_ptr<ports::input::ISessionKeyService> service)
        : service_(std::move(service))
    {
        std::cout << "[GetSessionKeyHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
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
            auto result = service_->get(accountId, keyId);
            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }
            sendJson(res, 200, sessionKeyToJson(*result.sessionKey));

        } catch (const std::exception& e) {
            sendException(res, "GetSessionKeyHandler", e);
        }
    }

private:
    std::shared_ptr<ports::input::ISessionKeyService> service_;
};

} // namespace sessionkeys::adapters::primary
