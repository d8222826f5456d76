#pragma once

#include "application/UsageTracker.hpp"
#include "domain/SessionKey.hpp"
#include "domain/AuthorizationDecision.hpp"
#include <optional>
#include <string>

namespace sessionkeys::application {

/**
 * @brief Чистая функция политики: (запись, адресат, сумма, now) -> решение
 *
 * Состояние не меняет. Порядок проверок фиксирован, первая
 * непройденная определяет причину отказа:
 *   1. запись существует
 *   2. ключ активен
 *   3. now < expiryTime
 *   4. адресат в allow-list (пустой список разрешает всех)
 *   5. value <= spendingLimit
 *   6. usedToday (после виртуального сброса) + value <= dailyLimit
 *
 * @throws domain::InvariantViolation если запись повреждена
 */
class PolicyEvaluator {
public:
    static domain::AuthorizationDecision evaluate(
        const std::optional<domain::SessionKey>& key,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now)
    {
        if (!key) {
            return domain::AuthorizationDecision::deny(
                domain::DenialReason::SESSION_KEY_NOT_FOUND, "Session key not found", 0, value);
        }
        return evaluate(*key, target, value, now);
    }

    static domain::AuthorizationDecision evaluate(
        const domain::SessionKey& key,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now)
    {
        using domain::AuthorizationDecision;
        using domain::DenialReason;

        domain::verifyInvariants(key);

        if (!key.isActive) {
            return AuthorizationDecision::deny(
                DenialReason::SESSION_KEY_INACTIVE, "Session key is revoked", 0, value);
        }

        if (key.isExpired(now)) {
            return AuthorizationDecision::deny(
                DenialReason::SESSION_KEY_EXPIRED,
                "Session key expired at " + std::to_string(key.expiryTime), 0, value);
        }

        if (!key.isTargetAllowed(target)) {
            return AuthorizationDecision::deny(
                DenialReason::TARGET_NOT_ALLOWED,
                "Target " + target + " is not in the allow-list", 0, value);
        }

        if (value > key.spendingLimit) {
            return AuthorizationDecision::deny(
                DenialReason::SPENDING_LIMIT_EXCEEDED,
                "Value " + domain::toString(value) + " exceeds per-operation limit " +
                    domain::toString(key.spendingLimit),
                key.spendingLimit, value);
        }

        // usedToday <= dailyLimit по инварианту, вычитание не переполняется
        domain::Amount used = UsageTracker::effectiveUsedToday(key, now);
        domain::Amount remaining = key.dailyLimit - used;
        if (value > remaining) {
            return AuthorizationDecision::deny(
                DenialReason::DAILY_LIMIT_EXCEEDED,
                "Value " + domain::toString(value) + " exceeds remaining daily budget " +
                    domain::toString(remaining) + " of " +
                    domain::toString(key.dailyLimit),
                key.dailyLimit, value);
        }

        return AuthorizationDecision::allow(value);
    }
};

} // namespace sessionkeys::application
