#pragma once

#include "ports/input/ISessionKeyService.hpp"
#include "ports/output/ISessionKeyRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/SessionKeySettings.hpp"
#include "domain/events/DomainEvent.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace sessionkeys::application {

/**
 * @brief Движок авторизации сессионных ключей
 *
 * Реестр, оценка политики и учёт расхода в одном сервисе.
 *
 * Конкурентность: у каждой пары (accountId, keyId) свой мьютекс,
 * общего лока на аккаунт или реестр нет. Мутация выполняется под
 * мьютексом записи как чтение из репозитория, оценка, условное
 * обновление по версии и публикация события. Конфликт версии
 * (запись изменил другой экземпляр сервиса) ведёт к перечитыванию
 * и повторной оценке.
 */
class SessionKeyService : public ports::input::ISessionKeyService {
public:
    static constexpr const char* kModuleName = "SessionKeyModule";
    static constexpr const char* kModuleVersion = "1.0.0";

    SessionKeyService(
        std::shared_ptr<settings::SessionKeySettings> settings,
        std::shared_ptr<ports::output::ISessionKeyRepository> repository,
        std::shared_ptr<ports::output::IEventPublisher> publisher
    );

    ports::input::SessionKeyResult grant(
        const ports::input::GrantRequest& request,
        domain::UnixTime now
    ) override;

    ports::input::RevokeResult revoke(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime now
    ) override;

    ports::input::SessionKeyResult updateLimits(
        const std::string& accountId,
        const std::string& keyId,
        const domain::Amount& newSpendingLimit,
        const domain::Amount& newDailyLimit,
        domain::UnixTime now
    ) override;

    ports::input::SessionKeyResult extendExpiry(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime newExpiryTime,
        domain::UnixTime now
    ) override;

    ports::input::RevokeAllResult emergencyRevokeAll(
        const std::string& accountId,
        domain::UnixTime now
    ) override;

    ports::input::SessionKeyResult get(const std::string& accountId, const std::string& keyId) override;

    std::vector<std::string> listActive(const std::string& accountId) override;

    std::vector<domain::SessionKey> listAll(const std::string& accountId) override;

    ports::input::UsageResult getUsage(
        const std::string& accountId,
        const std::string& keyId,
        domain::UnixTime now
    ) override;

    domain::AuthorizationDecision checkValidity(
        const std::string& accountId,
        const std::string& keyId,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now
    ) override;

    domain::AuthorizationDecision authorize(
        const std::string& accountId,
        const std::string& keyId,
        const std::string& target,
        const domain::Amount& value,
        domain::UnixTime now
    ) override;

    /**
     * @brief Число записей, для которых заведён мьютекс
     *
     * Растёт только с числом существующих записей.
     */
    std::size_t trackedRecordCount() const;

private:
    struct RecordLock {
        std::mutex mutex;
    };

    enum class MutationOutcome {
        NOT_FOUND,
        UNCHANGED,
        COMMITTED
    };

    std::unique_lock<std::mutex> lockRecord(const std::string& accountId, const std::string& keyId);

    /**
     * @brief Взять мьютекс записи, если она существует
     * @return std::nullopt, если записи нет (ячейка при этом не создаётся)
     */
    std::optional<std::unique_lock<std::mutex>> lockExistingRecord(
        const std::string& accountId,
        const std::string& keyId
    );

    /**
     * @brief Применить мутацию к записи с повтором при конфликте версий
     *
     * Вызывается под мьютексом записи. mutation получает копию последнего
     * зафиксированного состояния и возвращает false, если менять нечего
     * (отказ политики, повторный отзыв, невалидные параметры).
     * С enforceInvariants == false инварианты лимитов не проверяются
     * ни до, ни после мутации (отзыв).
     *
     * @throws domain::InvariantViolation если запись испорчена
     * @throws domain::ConcurrentModificationError если попытки исчерпаны
     */
    template <typename Mutation>
    MutationOutcome mutateRecord(
        const std::string& accountId,
        const std::string& keyId,
        Mutation&& mutation,
        domain::SessionKey& committed,
        bool enforceInvariants = true
    );

    void publish(const domain::DomainEvent& event);

    std::shared_ptr<settings::SessionKeySettings> settings_;
    std::shared_ptr<ports::output::ISessionKeyRepository> repository_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    ThreadSafeMap<std::string, RecordLock> recordLocks_;
};

} // namespace sessionkeys::application
