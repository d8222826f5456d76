#pragma once

#include <IHttpHandler.hpp>
#include "domain/SessionKey.hpp"
#include "domain/SessionKeyUsage.hpp"
#include "domain/AuthorizationDecision.hpp"
#include "domain/enums/ErrorCode.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <iostream>
#include <string>

namespace sessionkeys::adapters::primary {

// Общий JSON-маппинг для HTTP-хендлеров сессионных ключей.
// Суммы всегда десятичные строки: uint256 не влезает в число JSON.

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    sendJson(res, status, error);
}

inline void sendError(IResponse& res, domain::ErrorCode code, const std::string& message) {
    int status = 400;
    if (code == domain::ErrorCode::NOT_FOUND) {
        status = 404;
    } else if (code == domain::ErrorCode::ALREADY_EXISTS) {
        status = 409;
    } else if (code == domain::ErrorCode::REVOKE_INCOMPLETE) {
        status = 500;
    }

    nlohmann::json error;
    error["error"] = message;
    error["code"] = domain::toString(code);
    sendJson(res, status, error);
}

/**
 * @brief Обязательное строковое поле тела запроса
 * @throws std::invalid_argument если поля нет или оно не строка
 */
inline std::string requireString(const nlohmann::json& body, const char* field) {
    if (!body.contains(field) || !body[field].is_string()) {
        throw std::invalid_argument(std::string(field) + " is required");
    }
    return body[field].get<std::string>();
}

/**
 * @brief Сумма из тела запроса: десятичная строка или неотрицательное целое
 * @throws std::invalid_argument
 */
inline domain::Amount requireAmount(const nlohmann::json& body, const char* field) {
    if (!body.contains(field)) {
        throw std::invalid_argument(std::string(field) + " is required");
    }
    const auto& value = body[field];
    if (value.is_string()) {
        return domain::parseAmount(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return domain::Amount(value.get<std::uint64_t>());
    }
    throw std::invalid_argument(std::string(field) + " must be a decimal string");
}

inline domain::UnixTime requireTime(const nlohmann::json& body, const char* field) {
    if (!body.contains(field) || !body[field].is_number_integer()) {
        throw std::invalid_argument(std::string(field) + " must be an integer unix time");
    }
    return body[field].get<domain::UnixTime>();
}

inline nlohmann::json sessionKeyToJson(const domain::SessionKey& key) {
    nlohmann::json j;
    j["account_id"] = key.accountId;
    j["key_id"] = key.keyId;
    j["spending_limit"] = domain::toString(key.spendingLimit);
    j["daily_limit"] = domain::toString(key.dailyLimit);
    j["used_today"] = domain::toString(key.usedToday);
    j["last_used_day"] = key.lastUsedDay;
    j["expiry_time"] = key.expiryTime;
    j["allowed_targets"] = nlohmann::json::array();
    for (const auto& target : key.allowedTargets) {
        j["allowed_targets"].push_back(target);
    }
    j["is_active"] = key.isActive;
    j["created_at"] = key.createdAt;
    j["version"] = key.version;
    return j;
}

inline nlohmann::json usageToJson(const domain::SessionKeyUsage& usage) {
    nlohmann::json j;
    j["used_today"] = domain::toString(usage.usedToday);
    j["remaining_daily"] = domain::toString(usage.remainingDaily);
    j["remaining_per_tx"] = domain::toString(usage.remainingPerTx);
    j["time_until_expiry"] = usage.timeUntilExpiry;
    return j;
}

inline nlohmann::json decisionToJson(const domain::AuthorizationDecision& decision) {
    nlohmann::json j;
    j["allowed"] = decision.allowed;
    if (!decision.allowed) {
        j["reason"] = domain::toString(decision.reason);
        j["limit"] = domain::toString(decision.limit);
        j["attempted"] = domain::toString(decision.attempted);
        j["message"] = decision.message;
    }
    return j;
}

/**
 * @brief Ответ на исключение из сервиса
 *
 * Ошибки разбора (JSON, суммы) -> 400, нарушение инварианта -> 500
 * с отдельным кодом, остальное -> 500.
 */
inline void sendException(IResponse& res, const char* component, const std::exception& e) {
    if (dynamic_cast<const nlohmann::json::exception*>(&e) != nullptr ||
        dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        sendError(res, 400, e.what());
        return;
    }
    std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
    if (dynamic_cast<const domain::InvariantViolation*>(&e) != nullptr) {
        nlohmann::json error;
        error["error"] = "invariant_violation";
        error["message"] = e.what();
        sendJson(res, 500, error);
        return;
    }
    sendError(res, 500, "Internal server error");
}

} // namespace sessionkeys::adapters::primary
