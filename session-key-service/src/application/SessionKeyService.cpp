#include "application/SessionKeyService.hpp"
#include "application/PolicyEvaluator.hpp"
#include "application/UsageTracker.hpp"
#include "domain/events/SessionKeyGrantedEvent.hpp"
#include "domain/events/SessionKeyRevokedEvent.hpp"
#include "domain/events/SessionKeyLimitsUpdatedEvent.hpp"
#include "domain/events/SessionKeyExpiryExtendedEvent.hpp"
#include "domain/events/EmergencyRevokeAllEvent.hpp"
#include "domain/events/SessionKeyUsedEvent.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace sessionkeys::application {

using ports::input::GrantRequest;
using ports::input::RevokeAllResult;
using ports::input::RevokeResult;
using ports::input::SessionKeyResult;
using ports::input::UsageResult;
using domain::ErrorCode;

namespace {

std::string describe(const std::string& accountId, const std::string& keyId) {
    return accountId + "/" + keyId;
}

std::string lockKey(const std::string& accountId, const std::string& keyId) {
    return accountId + '\x1f' + keyId;
}

// Отзыв не проверяет инварианты лимитов: испорченную запись тоже
// нужно уметь выключить
bool deactivate(domain::SessionKey& key) {
    if (!key.isActive) {
        return false;
    }
    key.isActive = false;
    return true;
}

} // namespace

SessionKeyService::SessionKeyService(
    std::shared_ptr<settings::SessionKeySettings> settings,
    std::shared_ptr<ports::output::ISessionKeyRepository> repository,
    std::shared_ptr<ports::output::IEventPublisher> publisher
) : settings_(std::move(settings))
  , repository_(std::move(repository))
  , publisher_(std::move(publisher))
{
    std::cout << "[SessionKeyService] Created (" << kModuleName << " v" << kModuleVersion
              << ", max commit attempts: " << settings_->getMaxCommitAttempts() << ")" << std::endl;
}

// ============================================================================
// Record locking
// ============================================================================

std::unique_lock<std::mutex> SessionKeyService::lockRecord(
    const std::string& accountId,
    const std::string& keyId)
{
    // Ячейки не удаляются, поэтому мьютекс переживает возвращённый лок
    auto cell = recordLocks_.findOrInsert(lockKey(accountId, keyId), []() {
        return std::make_shared<RecordLock>();
    });
    return std::unique_lock<std::mutex>(cell->mutex);
}

std::optional<std::unique_lock<std::mutex>> SessionKeyService::lockExistingRecord(
    const std::string& accountId,
    const std::string& keyId)
{
    if (auto cell = recordLocks_.find(lockKey(accountId, keyId))) {
        return std::unique_lock<std::mutex>(cell->mutex);
    }
    // Записи не удаляются: ячейка заводится только под существующую запись,
    // поэтому таблица локов не растёт от запросов с чужими keyId
    if (!repository_->findByKey(accountId, keyId)) {
        return std::nullopt;
    }
    return lockRecord(accountId, keyId);
}

std::size_t SessionKeyService::trackedRecordCount() const {
    return recordLocks_.size();
}

template <typename Mutation>
SessionKeyService::MutationOutcome SessionKeyService::mutateRecord(
    const std::string& accountId,
    const std::string& keyId,
    Mutation&& mutation,
    domain::SessionKey& committed,
    bool enforceInvariants)
{
    const int maxAttempts = settings_->getMaxCommitAttempts();

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        auto current = repository_->findByKey(accountId, keyId);
        if (!current) {
            return MutationOutcome::NOT_FOUND;
        }
        if (enforceInvariants) {
            domain::verifyInvariants(*current);
        }

        domain::SessionKey updated = *current;
        if (!mutation(updated)) {
            return MutationOutcome::UNCHANGED;
        }
        updated.version = current->version + 1;
        if (enforceInvariants) {
            domain::verifyInvariants(updated);
        }

        if (repository_->update(updated, current->version)) {
            committed = std::move(updated);
            return MutationOutcome::COMMITTED;
        }

        std::cerr << "[SessionKeyService] Version conflict on " << describe(accountId, keyId)
                  << " (attempt " << attempt << "/" << maxAttempts << ")" << std::endl;
    }

    throw domain::ConcurrentModificationError(
        "Record " + describe(accountId, keyId) + " changed concurrently "
        + std::to_string(maxAttempts) + " times in a row");
}

void SessionKeyService::publish(const domain::DomainEvent& event) {
    // Мутация уже зафиксирована; сбой доставки не откатывает её
    try {
        publisher_->publish(event.eventType, event.toJson());
    } catch (const std::exception& e) {
        std::cerr << "[SessionKeyService] Failed to publish " << event.eventType
                  << " " << event.eventId << ": " << e.what() << std::endl;
    }
}

// ============================================================================
// Registry & lifecycle
// ============================================================================

SessionKeyResult SessionKeyService::grant(const GrantRequest& request, domain::UnixTime now) {
    if (domain::isZeroIdentity(request.accountId)) {
        return {false, ErrorCode::INVALID_ACCOUNT, "Invalid account", std::nullopt};
    }
    if (domain::isZeroIdentity(request.keyId)) {
        return {false, ErrorCode::INVALID_KEY, "Invalid session key", std::nullopt};
    }
    if (request.dailyLimit < request.spendingLimit) {
        return {false, ErrorCode::INVALID_LIMITS, "Daily limit too low", std::nullopt};
    }
    if (request.expiryTime <= now) {
        return {false, ErrorCode::INVALID_EXPIRY, "Invalid expiry time", std::nullopt};
    }

    domain::SessionKey key(
        request.accountId,
        request.keyId,
        request.spendingLimit,
        request.dailyLimit,
        request.expiryTime,
        std::set<std::string>(request.allowedTargets.begin(), request.allowedTargets.end()),
        now
    );

    auto lock = lockRecord(request.accountId, request.keyId);

    if (!repository_->insert(key)) {
        return {false, ErrorCode::ALREADY_EXISTS, "Session key already granted", std::nullopt};
    }

    domain::SessionKeyGrantedEvent event{domain::Timestamp(now)};
    event.accountId = key.accountId;
    event.keyId = key.keyId;
    event.spendingLimit = key.spendingLimit;
    event.dailyLimit = key.dailyLimit;
    event.expiryTime = key.expiryTime;
    event.allowedTargets = key.allowedTargets;
    event.version = key.version;
    publish(event);

    std::cout << "[SessionKeyService] Granted " << describe(key.accountId, key.keyId)
              << " spendingLimit=" << key.spendingLimit
              << " dailyLimit=" << key.dailyLimit
              << " expiry=" << key.expiryTime
              << " targets=" << key.allowedTargets.size() << std::endl;

    return {true, ErrorCode::NONE, "Session key granted", key};
}

RevokeResult SessionKeyService::revoke(
    const std::string& accountId,
    const std::string& keyId,
    domain::UnixTime now)
{
    auto lock = lockExistingRecord(accountId, keyId);
    if (!lock) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", false};
    }

    domain::SessionKey committed;
    auto outcome = mutateRecord(accountId, keyId, deactivate, committed, false);

    if (outcome == MutationOutcome::NOT_FOUND) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", false};
    }
    if (outcome == MutationOutcome::UNCHANGED) {
        return {true, ErrorCode::NONE, "Session key already revoked", false};
    }

    domain::SessionKeyRevokedEvent event{domain::Timestamp(now)};
    event.accountId = accountId;
    event.keyId = keyId;
    event.version = committed.version;
    publish(event);

    std::cout << "[SessionKeyService] Revoked " << describe(accountId, keyId) << std::endl;
    return {true, ErrorCode::NONE, "Session key revoked", true};
}

SessionKeyResult SessionKeyService::updateLimits(
    const std::string& accountId,
    const std::string& keyId,
    const domain::Amount& newSpendingLimit,
    const domain::Amount& newDailyLimit,
    domain::UnixTime now)
{
    auto lock = lockExistingRecord(accountId, keyId);
    if (!lock) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }

    bool limitsInvalid = false;
    domain::Amount oldSpendingLimit;
    domain::Amount oldDailyLimit;
    domain::SessionKey committed;

    auto outcome = mutateRecord(accountId, keyId, [&](domain::SessionKey& key) {
        if (newDailyLimit < newSpendingLimit) {
            limitsInvalid = true;
            return false;
        }
        oldSpendingLimit = key.spendingLimit;
        oldDailyLimit = key.dailyLimit;
        key.spendingLimit = newSpendingLimit;
        key.dailyLimit = newDailyLimit;
        // Бюджет дня исчерпан, если новый лимит ниже уже потраченного
        if (key.usedToday > key.dailyLimit) {
            key.usedToday = key.dailyLimit;
        }
        return true;
    }, committed);

    if (outcome == MutationOutcome::NOT_FOUND) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }
    if (limitsInvalid) {
        return {false, ErrorCode::INVALID_LIMITS, "Daily limit too low", std::nullopt};
    }

    domain::SessionKeyLimitsUpdatedEvent event{domain::Timestamp(now)};
    event.accountId = accountId;
    event.keyId = keyId;
    event.oldSpendingLimit = oldSpendingLimit;
    event.oldDailyLimit = oldDailyLimit;
    event.newSpendingLimit = committed.spendingLimit;
    event.newDailyLimit = committed.dailyLimit;
    event.usedToday = committed.usedToday;
    event.version = committed.version;
    publish(event);

    std::cout << "[SessionKeyService] Limits updated " << describe(accountId, keyId)
              << " spendingLimit " << oldSpendingLimit << " -> " << committed.spendingLimit
              << ", dailyLimit " << oldDailyLimit << " -> " << committed.dailyLimit << std::endl;

    return {true, ErrorCode::NONE, "Session key limits updated", committed};
}

SessionKeyResult SessionKeyService::extendExpiry(
    const std::string& accountId,
    const std::string& keyId,
    domain::UnixTime newExpiryTime,
    domain::UnixTime now)
{
    auto lock = lockExistingRecord(accountId, keyId);
    if (!lock) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }

    bool expiryInvalid = false;
    domain::UnixTime oldExpiryTime = 0;
    domain::SessionKey committed;

    auto outcome = mutateRecord(accountId, keyId, [&](domain::SessionKey& key) {
        // Сократить срок этим вызовом нельзя - только через отзыв
        if (newExpiryTime <= key.expiryTime || newExpiryTime <= now) {
            expiryInvalid = true;
            return false;
        }
        oldExpiryTime = key.expiryTime;
        key.expiryTime = newExpiryTime;
        return true;
    }, committed);

    if (outcome == MutationOutcome::NOT_FOUND) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }
    if (expiryInvalid) {
        return {false, ErrorCode::INVALID_EXPIRY, "Invalid expiry time", std::nullopt};
    }

    domain::SessionKeyExpiryExtendedEvent event{domain::Timestamp(now)};
    event.accountId = accountId;
    event.keyId = keyId;
    event.oldExpiryTime = oldExpiryTime;
    event.newExpiryTime = committed.expiryTime;
    event.version = committed.version;
    publish(event);

    std::cout << "[SessionKeyService] Expiry extended " << describe(accountId, keyId)
              << " " << oldExpiryTime << " -> " << committed.expiryTime << std::endl;

    return {true, ErrorCode::NONE, "Session key extended", committed};
}

RevokeAllResult SessionKeyService::emergencyRevokeAll(const std::string& accountId, domain::UnixTime now) {
    if (domain::isZeroIdentity(accountId)) {
        return {false, ErrorCode::INVALID_ACCOUNT, "Invalid account", 0, {}};
    }

    std::vector<std::string> candidates;
    for (const auto& record : repository_->findByAccount(accountId)) {
        if (record.isActive) {
            candidates.push_back(record.keyId);
        }
    }
    std::sort(candidates.begin(), candidates.end());

    // Берём локи всех кандидатов до первой мутации: ни одна авторизация
    // не пройдёт посреди отзыва, а агрегированное событие уходит раньше
    // любых последующих событий по этим ключам. Остальные операции держат
    // не больше одного лока, поэтому взаимной блокировки нет.
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(candidates.size());
    for (const auto& keyId : candidates) {
        locks.push_back(lockRecord(accountId, keyId));
    }

    // Сбой на одном ключе не останавливает отзыв остальных. Событие
    // публикуется всегда и перечисляет ровно зафиксированные отзывы.
    RevokeAllResult result{true, ErrorCode::NONE, "", 0, {}, {}};
    for (const auto& keyId : candidates) {
        try {
            domain::SessionKey committed;
            auto outcome = mutateRecord(accountId, keyId, deactivate, committed, false);
            if (outcome == MutationOutcome::COMMITTED) {
                result.revokedKeys.push_back(keyId);
            }
        } catch (const std::exception& e) {
            std::cerr << "[SessionKeyService] Emergency revoke failed for "
                      << describe(accountId, keyId) << ": " << e.what() << std::endl;
            result.failedKeys.push_back(keyId);
        }
    }
    result.revokedCount = result.revokedKeys.size();
    result.message = "Revoked " + std::to_string(result.revokedCount) + " session keys";
    if (!result.failedKeys.empty()) {
        result.success = false;
        result.error = ErrorCode::REVOKE_INCOMPLETE;
        result.message += ", " + std::to_string(result.failedKeys.size()) + " failed";
    }

    domain::EmergencyRevokeAllEvent event{domain::Timestamp(now)};
    event.accountId = accountId;
    event.revokedCount = result.revokedCount;
    event.revokedKeys = result.revokedKeys;
    event.failedKeys = result.failedKeys;
    publish(event);

    std::cout << "[SessionKeyService] Emergency revoke for " << accountId
              << ": " << result.revokedCount << " keys";
    if (!result.failedKeys.empty()) {
        std::cout << ", " << result.failedKeys.size() << " failed";
    }
    std::cout << std::endl;

    return result;
}

// ============================================================================
// Queries
// ============================================================================

SessionKeyResult SessionKeyService::get(const std::string& accountId, const std::string& keyId) {
    auto key = repository_->findByKey(accountId, keyId);
    if (!key) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }
    domain::verifyInvariants(*key);
    return {true, ErrorCode::NONE, "", key};
}

std::vector<std::string> SessionKeyService::listActive(const std::string& accountId) {
    std::vector<std::string> active;
    for (const auto& key : repository_->findByAccount(accountId)) {
        if (key.isActive) {
            active.push_back(key.keyId);
        }
    }
    std::sort(active.begin(), active.end());
    return active;
}

std::vector<domain::SessionKey> SessionKeyService::listAll(const std::string& accountId) {
    auto keys = repository_->findByAccount(accountId);
    std::sort(keys.begin(), keys.end(), [](const domain::SessionKey& a, const domain::SessionKey& b) {
        return a.keyId < b.keyId;
    });
    return keys;
}

UsageResult SessionKeyService::getUsage(
    const std::string& accountId,
    const std::string& keyId,
    domain::UnixTime now)
{
    auto key = repository_->findByKey(accountId, keyId);
    if (!key) {
        return {false, ErrorCode::NOT_FOUND, "Session key not found", std::nullopt};
    }
    domain::verifyInvariants(*key);
    return {true, ErrorCode::NONE, "", UsageTracker::usage(*key, now)};
}

domain::AuthorizationDecision SessionKeyService::checkValidity(
    const std::string& accountId,
    const std::string& keyId,
    const std::string& target,
    const domain::Amount& value,
    domain::UnixTime now)
{
    // Ленивый сброс суток здесь только виртуальный, запись не сохраняется
    return PolicyEvaluator::evaluate(repository_->findByKey(accountId, keyId), target, value, now);
}

// ============================================================================
// Authorization
// ============================================================================

domain::AuthorizationDecision SessionKeyService::authorize(
    const std::string& accountId,
    const std::string& keyId,
    const std::string& target,
    const domain::Amount& value,
    domain::UnixTime now)
{
    domain::AuthorizationDecision decision;
    domain::SessionKey committed;
    auto outcome = MutationOutcome::NOT_FOUND;

    auto lock = lockExistingRecord(accountId, keyId);
    if (lock) {
        outcome = mutateRecord(accountId, keyId, [&](domain::SessionKey& key) {
            decision = PolicyEvaluator::evaluate(key, target, value, now);
            if (!decision.allowed) {
                return false;
            }
            UsageTracker::recordUsage(key, value, now);
            return true;
        }, committed);
    }

    if (outcome == MutationOutcome::NOT_FOUND) {
        decision = PolicyEvaluator::evaluate(std::nullopt, target, value, now);
    }

    if (outcome != MutationOutcome::COMMITTED) {
        std::cout << "[SessionKeyService] Denied " << describe(accountId, keyId)
                  << " target=" << target << " value=" << value
                  << " reason=" << domain::toString(decision.reason) << std::endl;
        return decision;
    }

    domain::SessionKeyUsedEvent event{domain::Timestamp(now)};
    event.accountId = accountId;
    event.keyId = keyId;
    event.target = target;
    event.value = value;
    event.usedToday = committed.usedToday;
    event.dailyLimit = committed.dailyLimit;
    event.dayIndex = committed.lastUsedDay;
    event.version = committed.version;
    publish(event);

    return decision;
}

} // namespace sessionkeys::application
