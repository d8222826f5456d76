#pragma once

#include "domain/SessionKey.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace sessionkeys::ports::output {

/**
 * @brief Интерфейс репозитория сессионных ключей
 *
 * Output Port долговременного хранилища. Запись адресуется парой
 * (accountId, keyId). Обновление условное по версии, поэтому
 * несколько экземпляров сервиса над одной БД не теряют мутаций.
 */
class ISessionKeyRepository {
public:
    virtual ~ISessionKeyRepository() = default;

    /**
     * @brief Найти запись по паре (accountId, keyId)
     * @return Последнее зафиксированное состояние или nullopt
     */
    virtual std::optional<domain::SessionKey> findByKey(
        const std::string& accountId,
        const std::string& keyId
    ) = 0;

    /**
     * @brief Все записи аккаунта, включая отозванные
     */
    virtual std::vector<domain::SessionKey> findByAccount(const std::string& accountId) = 0;

    /**
     * @brief Вставить новую запись
     * @return false если запись для пары уже существует
     */
    virtual bool insert(const domain::SessionKey& key) = 0;

    /**
     * @brief Заменить запись, если её версия равна expectedVersion
     * @return false при конфликте версий или отсутствии записи
     */
    virtual bool update(const domain::SessionKey& key, std::uint64_t expectedVersion) = 0;
};

} // namespace sessionkeys::ports::output
