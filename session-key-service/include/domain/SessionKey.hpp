#pragma once

#include "domain/Amount.hpp"
#include "domain/Timestamp.hpp"
#include "domain/DomainErrors.hpp"
#include <string>
#include <set>
#include <cstdint>

namespace sessionkeys::domain {

/**
 * @brief Сессионный ключ: делегированное право действовать от имени аккаунта
 *
 * Адресуется парой (accountId, keyId). Отозванная запись не удаляется,
 * а остаётся для аудита и навсегда исключается из авторизации.
 *
 * Инварианты: spendingLimit <= dailyLimit, usedToday <= dailyLimit.
 */
struct SessionKey {
    std::string accountId;              ///< Аккаунт-владелец (ключ партиционирования)
    std::string keyId;                  ///< Идентичность делегированного ключа
    Amount spendingLimit;               ///< Максимум на одну операцию
    Amount dailyLimit;                  ///< Максимум за сутки
    Amount usedToday;                   ///< Потрачено в текущих сутках
    std::int64_t lastUsedDay = 0;       ///< Сутки, к которым относится usedToday
    UnixTime expiryTime = 0;            ///< После этого момента ключ непригоден
    std::set<std::string> allowedTargets;  ///< Пустое множество = любой адресат
    bool isActive = false;              ///< false после отзыва
    UnixTime createdAt = 0;
    std::uint64_t version = 0;          ///< Номер последней зафиксированной мутации

    SessionKey() = default;

    SessionKey(const std::string& accountId,
               const std::string& keyId,
               const Amount& spendingLimit,
               const Amount& dailyLimit,
               UnixTime expiryTime,
               std::set<std::string> allowedTargets,
               UnixTime now)
        : accountId(accountId)
        , keyId(keyId)
        , spendingLimit(spendingLimit)
        , dailyLimit(dailyLimit)
        , usedToday(0)
        , lastUsedDay(dayIndex(now))
        , expiryTime(expiryTime)
        , allowedTargets(std::move(allowedTargets))
        , isActive(true)
        , createdAt(now)
        , version(1)
    {}

    bool isExpired(UnixTime now) const {
        return now >= expiryTime;
    }

    bool isTargetAllowed(const std::string& target) const {
        return allowedTargets.empty() || allowedTargets.count(target) > 0;
    }
};

/**
 * @brief Проверка структурных инвариантов записи
 *
 * Граница реестра не пропускает такие записи, поэтому нарушение означает
 * ошибку в коде или порчу хранилища, а не поведение вызывающей стороны.
 *
 * @throws InvariantViolation
 */
inline void verifyInvariants(const SessionKey& key) {
    if (key.spendingLimit > key.dailyLimit) {
        throw InvariantViolation(
            "spendingLimit > dailyLimit for " + key.accountId + "/" + key.keyId);
    }
    if (key.usedToday > key.dailyLimit) {
        throw InvariantViolation(
            "usedToday > dailyLimit for " + key.accountId + "/" + key.keyId);
    }
}

/**
 * @brief Нулевая идентичность: пустая строка или "0x" и одни нули
 */
inline bool isZeroIdentity(const std::string& id) {
    if (id.empty()) {
        return true;
    }
    if (id.size() > 2 && id[0] == '0' && (id[1] == 'x' || id[1] == 'X')) {
        return id.find_first_not_of('0', 2) == std::string::npos;
    }
    return false;
}

} // namespace sessionkeys::domain
