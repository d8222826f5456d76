#pragma once

#include "domain/SessionKey.hpp"
#include "domain/SessionKeyUsage.hpp"
#include "domain/AuthorizationDecision.hpp"
#include "domain/enums/ErrorCode.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace sessionkeys::ports::input {

/**
 * @brief Запрос на выдачу сессионного ключа
 */
struct GrantRequest {
    std::string accountId;
    std::string keyId;
    domain::Amount spendingLimit;
    domain::Amount dailyLimit;
    domain::UnixTime expiryTime = 0;
    std::vector<std::string> allowedTargets;   // Пусто = без ограничений
};

/**
 * @brief Результат операции над одной записью
 */
struct SessionKeyResult {
    bool success = false;
    domain::ErrorCode error = domain::ErrorCode::NONE;
    std::string message;
    std::optional<domain::SessionKey> sessionKey;
};

/**
 * @brief Результат отзыва
 *
 * changed == false: ключ уже был неактивен, событие не публиковалось.
 */
struct RevokeResult {
    bool success = false;
    domain::ErrorCode error = domain::ErrorCode::NONE;
    std::string message;
    bool changed = false;
};

/**
 * @brief Результат аварийного отзыва всех ключей
 *
 * failedKeys не пуст: часть ключей отозвать не удалось (error ==
 * REVOKE_INCOMPLETE), revokedKeys перечисляет зафиксированные отзывы.
 */
struct RevokeAllResult {
    bool success = false;
    domain::ErrorCode error = domain::ErrorCode::NONE;
    std::string message;
    std::size_t revokedCount = 0;
    std::vector<std::string> revokedKeys;
    std::vector<std::string> failedKeys;
};

/**
 * @brief Результат запроса статистики использования
 */
struct UsageResult {
    bool success = false;
    domain::ErrorCode error = domain::ErrorCode::NONE;
    std::string message;
    std::optional<domain::SessionKeyUsage> usage;
};

/**
 * @brief Интерфейс движка авторизации сессионных ключей
 *
 * Все операции синхронные. Ожидаемые исходы (не найдено, лимит превышен,
 * истёк срок) возвращаются в результате. Исключения означают нарушение
 * инварианта или сбой инфраструктуры.
 */
class ISessionKeyService {
public:
    virtual ~ISessionKeyService() = default;

    // ------------------------------------------------------------------
    // Реестр и жизненный цикл
    // ------------------------------------------------------------------

    /**
     * @brief Выдать новый активный ключ
     *
     * Ошибки: INVALID_ACCOUNT, INVALID_KEY, INVALID_LIMITS, INVALID_EXPIRY,
     * ALREADY_EXISTS.
     */
    virtual SessionKeyResult grant(const GrantRequest& request, domain::UnixTime now) = 0;

    /**
     * @brief Отозвать ключ (повторный отзыв - успешный no-op без события)
     */
    virtual RevokeResult revoke(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime now
    ) = 0;

    /**
     * @brief Изменить лимиты, не сбрасывая usedToday
     */
    virtual SessionKeyResult updateLimits(
        const std::string& accountId,
        const std::string& keyId,
        const domain::Amount& newSpendingLimit,
        const domain::Amount& newDailyLimit,
        domain::UnixTime now
    ) = 0;

    /**
     * @brief Продлить срок действия (только вперёд)
     */
    virtual SessionKeyResult extendExpiry(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime newExpiryTime,
        domain::UnixTime now
    ) = 0;

    /**
     * @brief Отозвать все активные ключи аккаунта
     */
    virtual RevokeAllResult emergencyRevokeAll(const std::string& accountId, domain::UnixTime now) = 0;

    // ------------------------------------------------------------------
    // Запросы (без побочных эффектов)
    // ------------------------------------------------------------------

    virtual SessionKeyResult get(const std::string& accountId, const std::string& keyId) = 0;

    /**
     * @brief Ключи с isActive == true (срок действия не учитывается)
     */
    virtual std::vector<std::string> listActive(const std::string& accountId) = 0;

    /**
     * @brief Все записи аккаунта, включая отозванные (история)
     */
    virtual std::vector<domain::SessionKey> listAll(const std::string& accountId) = 0;

    virtual UsageResult getUsage(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime now
    ) = 0;

    /**
     * @brief Проверка без списания бюджета
     */
    virtual domain::AuthorizationDecision checkValidity(
        const std::string& accountId,
        const std::string& keyId,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now
    ) = 0;

    // ------------------------------------------------------------------
    // Авторизация
    // ------------------------------------------------------------------

    /**
     * @brief Проверка со списанием бюджета при успехе
     *
     * Не идемпотентна: повтор успешного вызова списывает бюджет дважды.
     */
    virtual domain::AuthorizationDecision authorize(
        const std::string& accountId,
        const std::string& keyId,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now
    ) = 0;
};

} // namespace sessionkeys::ports::input
