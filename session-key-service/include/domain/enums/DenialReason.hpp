#pragma once

#include <string>

namespace sessionkeys::domain {

/**
 * @brief Причина отказа в авторизации
 *
 * Порядок перечисления совпадает с порядком проверок:
 * первая непройденная проверка определяет причину.
 */
enum class DenialReason {
    NONE,
    SESSION_KEY_NOT_FOUND,
    SESSION_KEY_INACTIVE,
    SESSION_KEY_EXPIRED,
    TARGET_NOT_ALLOWED,
    SPENDING_LIMIT_EXCEEDED,
    DAILY_LIMIT_EXCEEDED
};

inline std::string toString(DenialReason reason) {
    switch (reason) {
        case DenialReason::NONE:                    return "";
        case DenialReason::SESSION_KEY_NOT_FOUND:   return "SessionKeyNotFound";
        case DenialReason::SESSION_KEY_INACTIVE:    return "SessionKeyInactive";
        case DenialReason::SESSION_KEY_EXPIRED:     return "SessionKeyExpired";
        case DenialReason::TARGET_NOT_ALLOWED:      return "TargetNotAllowed";
        case DenialReason::SPENDING_LIMIT_EXCEEDED: return "SpendingLimitExceeded";
        case DenialReason::DAILY_LIMIT_EXCEEDED:    return "DailyLimitExceeded";
        default: return "Unknown";
    }
}

} // namespace sessionkeys::domain
