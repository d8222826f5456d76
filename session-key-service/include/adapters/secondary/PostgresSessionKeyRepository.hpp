#pragma once

#include "ports/output/ISessionKeyRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace sessionkeys::adapters::secondary {

/**
 * @brief PostgreSQL реализация ISessionKeyRepository
 *
 * Суммы хранятся в NUMERIC(78,0): этого хватает на 2^256 - 1.
 * Между pqxx и Amount они ходят десятичной строкой.
 * allowed_targets хранится JSON-массивом в TEXT.
 *
 * Обновление условное: UPDATE ... WHERE version = $expected.
 * Ноль затронутых строк означает конфликт версий.
 */
class PostgresSessionKeyRepository : public ports::output::ISessionKeyRepository {
public:
    explicit PostgresSessionKeyRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        t.exec(
            "CREATE TABLE IF NOT EXISTS session_keys ("
            "  account_id      TEXT NOT NULL,"
            "  key_id          TEXT NOT NULL,"
            "  spending_limit  NUMERIC(78,0) NOT NULL,"
            "  daily_limit     NUMERIC(78,0) NOT NULL,"
            "  used_today      NUMERIC(78,0) NOT NULL,"
            "  last_used_day   BIGINT NOT NULL,"
            "  expiry_time     BIGINT NOT NULL,"
            "  allowed_targets TEXT NOT NULL,"
            "  is_active       BOOLEAN NOT NULL,"
            "  created_at      BIGINT NOT NULL,"
            "  version         BIGINT NOT NULL,"
            "  PRIMARY KEY (account_id, key_id),"
            "  CHECK (spending_limit <= daily_limit),"
            "  CHECK (used_today <= daily_limit)"
            ")");
        t.commit();
        std::cout << "[SessionKeyRepo] Connected to " << settings_->getName() << std::endl;
    }

    std::optional<domain::SessionKey> findByKey(
        const std::string& accountId,
        const std::string& keyId) override
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            std::string(kSelectColumns) + " WHERE account_id=$1 AND key_id=$2",
            accountId, keyId);
        if (r.empty()) {
            return std::nullopt;
        }
        return mapRow(r[0]);
    }

    std::vector<domain::SessionKey> findByAccount(const std::string& accountId) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            std::string(kSelectColumns) + " WHERE account_id=$1 ORDER BY key_id",
            accountId);

        std::vector<domain::SessionKey> keys;
        keys.reserve(r.size());
        for (const auto& row : r) {
            keys.push_back(mapRow(row));
        }
        return keys;
    }

    bool insert(const domain::SessionKey& key) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "INSERT INTO session_keys (account_id, key_id, spending_limit, daily_limit, used_today, "
            "last_used_day, expiry_time, allowed_targets, is_active, created_at, version) "
            "VALUES ($1, $2, $3::numeric, $4::numeric, $5::numeric, $6, $7, $8, $9, $10, $11) "
            "ON CONFLICT (account_id, key_id) DO NOTHING",
            key.accountId,
            key.keyId,
            domain::toString(key.spendingLimit),
            domain::toString(key.dailyLimit),
            domain::toString(key.usedToday),
            key.lastUsedDay,
            key.expiryTime,
            targetsToJson(key.allowedTargets),
            key.isActive,
            key.createdAt,
            static_cast<long long>(key.version));
        t.commit();
        return r.affected_rows() == 1;
    }

    bool update(const domain::SessionKey& key, std::uint64_t expectedVersion) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "UPDATE session_keys SET spending_limit=$3::numeric, daily_limit=$4::numeric, "
            "used_today=$5::numeric, last_used_day=$6, expiry_time=$7, allowed_targets=$8, "
            "is_active=$9, version=$10 "
            "WHERE account_id=$1 AND key_id=$2 AND version=$11",
            key.accountId,
            key.keyId,
            domain::toString(key.spendingLimit),
            domain::toString(key.dailyLimit),
            domain::toString(key.usedToday),
            key.lastUsedDay,
            key.expiryTime,
            targetsToJson(key.allowedTargets),
            key.isActive,
            static_cast<long long>(key.version),
            static_cast<long long>(expectedVersion));
        t.commit();
        return r.affected_rows() == 1;
    }

private:
    static constexpr const char* kSelectColumns =
        "SELECT account_id, key_id, spending_limit::text, daily_limit::text, used_today::text, "
        "last_used_day, expiry_time, allowed_targets, is_active, created_at, version "
        "FROM session_keys";

    std::shared_ptr<settings::DbSettings> settings_;

    static std::string targetsToJson(const std::set<std::string>& targets) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& target : targets) {
            j.push_back(target);
        }
        return j.dump();
    }

    static domain::SessionKey mapRow(const pqxx::row& row) {
        domain::SessionKey key;
        key.accountId = row[0].as<std::string>();
        key.keyId = row[1].as<std::string>();
        key.spendingLimit = domain::parseAmount(row[2].as<std::string>());
        key.dailyLimit = domain::parseAmount(row[3].as<std::string>());
        key.usedToday = domain::parseAmount(row[4].as<std::string>());
        key.lastUsedDay = row[5].as<std::int64_t>();
        key.expiryTime = row[6].as<std::int64_t>();

        auto targets = nlohmann::json::parse(row[7].as<std::string>());
        for (const auto& target : targets) {
            key.allowedTargets.insert(target.get<std::string>());
        }

        key.isActive = row[8].as<bool>();
        key.createdAt = row[9].as<std::int64_t>();
        key.version = static_cast<std::uint64_t>(row[10].as<long long>());
        return key;
    }
};

} // namespace sessionkeys::adapters::secondary
