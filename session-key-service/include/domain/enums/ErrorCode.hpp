#pragma once

#include <string>

namespace sessionkeys::domain {

/**
 * @brief Ошибки реестра сессионных ключей
 *
 * Ожидаемые исходы валидации на границе реестра. Возвращаются
 * в результатах операций, а не бросаются.
 */
enum class ErrorCode {
    NONE,
    NOT_FOUND,          ///< Нет записи для (accountId, keyId)
    INVALID_ACCOUNT,    ///< Пустой или нулевой accountId
    INVALID_KEY,        ///< Пустой или нулевой keyId при выдаче
    INVALID_LIMITS,     ///< dailyLimit < spendingLimit
    INVALID_EXPIRY,     ///< Срок действия не строго в будущем
    ALREADY_EXISTS,     ///< Запись для пары уже выдавалась
    REVOKE_INCOMPLETE   ///< Аварийный отзыв не смог выключить часть ключей
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:            return "None";
        case ErrorCode::NOT_FOUND:       return "NotFound";
        case ErrorCode::INVALID_ACCOUNT: return "InvalidAccount";
        case ErrorCode::INVALID_KEY:     return "InvalidKey";
        case ErrorCode::INVALID_LIMITS:  return "InvalidLimits";
        case ErrorCode::INVALID_EXPIRY:  return "InvalidExpiry";
        case ErrorCode::ALREADY_EXISTS:  return "AlreadyExists";
        case ErrorCode::REVOKE_INCOMPLETE: return "RevokeIncomplete";
        default: return "Unknown";
    }
}

} // namespace sessionkeys::domain
