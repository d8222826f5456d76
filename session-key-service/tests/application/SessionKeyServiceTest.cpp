/**
 * @file SessionKeyServiceTest.cpp
 * @brief Unit-тесты SessionKeyService: реестр, жизненный цикл, авторизация
 */

#include <gtest/gtest.h>

#include "application/SessionKeyService.hpp"
#include "mocks/InMemorySessionKeyRepository.hpp"
#include "mocks/MockEventPublisher.hpp"

#include <nlohmann/json.hpp>

using namespace sessionkeys;
using namespace sessionkeys::domain;
using namespace sessionkeys::tests::mocks;

class SessionKeyServiceTest : public ::testing::Test {
protected:
    static constexpr UnixTime kDay = 19675;
    static constexpr UnixTime kNow = kDay * kSecondsPerDay + 36000;
    static constexpr const char* kAccount = "0xaccount";

    const Amount kEth = parseAmount("1000000000000000000");
    const Amount kTenthEth = parseAmount("100000000000000000");

    void SetUp() override {
        repository_ = std::make_shared<InMemorySessionKeyRepository>();
        publisher_ = std::make_shared<MockEventPublisher>();
        service_ = std::make_shared<application::SessionKeyService>(
            std::make_shared<settings::SessionKeySettings>(3), repository_, publisher_);
    }

    void TearDown() override {
        repository_->clear();
    }

    ports::input::SessionKeyResult grant(
        const std::string& keyId,
        std::vector<std::string> targets = {},
        UnixTime expiry = kNow + 3600)
    {
        ports::input::GrantRequest request;
        request.accountId = kAccount;
        request.keyId = keyId;
        request.spendingLimit = kTenthEth;
        request.dailyLimit = kEth;
        request.expiryTime = expiry;
        request.allowedTargets = std::move(targets);
        return service_->grant(request, kNow);
    }

    AuthorizationDecision authorize(const std::string& keyId, const Amount& value,
                                    UnixTime now = kNow, const std::string& target = "0xdex") {
        return service_->authorize(kAccount, keyId, target, value, now);
    }

    SessionKey stored(const std::string& keyId) {
        auto key = repository_->findByKey(kAccount, keyId);
        EXPECT_TRUE(key.has_value());
        return key.value_or(SessionKey{});
    }

    std::vector<std::string> routingKeys() {
        std::vector<std::string> keys;
        for (const auto& m : publisher_->getPublishedMessages()) {
            keys.push_back(m.routingKey);
        }
        return keys;
    }

    std::shared_ptr<InMemorySessionKeyRepository> repository_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<application::SessionKeyService> service_;
};

// ============================================
// GRANT
// ============================================

TEST_F(SessionKeyServiceTest, Grant_CreatesActiveRecord) {
    auto result = grant("0xkey1");

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.sessionKey.has_value());
    EXPECT_EQ(result.error, ErrorCode::NONE);

    auto key = stored("0xkey1");
    EXPECT_TRUE(key.isActive);
    EXPECT_EQ(key.usedToday, Amount(0));
    EXPECT_EQ(key.lastUsedDay, kDay);
    EXPECT_EQ(key.spendingLimit, kTenthEth);
    EXPECT_EQ(key.dailyLimit, kEth);
    EXPECT_EQ(key.version, 1u);
}

TEST_F(SessionKeyServiceTest, Grant_EmitsGrantedEventWithLimits) {
    grant("0xkey1", {"0xT1"});

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "session_key.granted");

    auto j = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(j["accountId"], kAccount);
    EXPECT_EQ(j["keyId"], "0xkey1");
    EXPECT_EQ(j["spendingLimit"], "100000000000000000");
    EXPECT_EQ(j["dailyLimit"], "1000000000000000000");
    EXPECT_EQ(j["expiryTime"], kNow + 3600);
    EXPECT_EQ(j["allowedTargets"][0], "0xT1");
    EXPECT_EQ(j["occurredAt"], kNow);
}

TEST_F(SessionKeyServiceTest, Grant_ZeroKey_InvalidKey) {
    EXPECT_EQ(grant("").error, ErrorCode::INVALID_KEY);
    EXPECT_EQ(grant("0x0000000000000000000000000000000000000000").error, ErrorCode::INVALID_KEY);
    EXPECT_EQ(repository_->size(), 0u);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(SessionKeyServiceTest, Grant_ZeroAccount_InvalidAccount) {
    ports::input::GrantRequest request;
    request.accountId = "0x0";
    request.keyId = "0xkey1";
    request.spendingLimit = kTenthEth;
    request.dailyLimit = kEth;
    request.expiryTime = kNow + 3600;

    auto result = service_->grant(request, kNow);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::INVALID_ACCOUNT);
}

TEST_F(SessionKeyServiceTest, Grant_DailyBelowSpending_InvalidLimits) {
    ports::input::GrantRequest request;
    request.accountId = kAccount;
    request.keyId = "0xkey1";
    request.spendingLimit = kEth;
    request.dailyLimit = kTenthEth;
    request.expiryTime = kNow + 3600;

    auto result = service_->grant(request, kNow);
    EXPECT_EQ(result.error, ErrorCode::INVALID_LIMITS);
    EXPECT_EQ(result.message, "Daily limit too low");
}

TEST_F(SessionKeyServiceTest, Grant_EqualLimitsAllowed) {
    ports::input::GrantRequest request;
    request.accountId = kAccount;
    request.keyId = "0xkey1";
    request.spendingLimit = kEth;
    request.dailyLimit = kEth;
    request.expiryTime = kNow + 3600;

    EXPECT_TRUE(service_->grant(request, kNow).success);
}

TEST_F(SessionKeyServiceTest, Grant_ExpiryNotInFuture_InvalidExpiry) {
    EXPECT_EQ(grant("0xkey1", {}, kNow).error, ErrorCode::INVALID_EXPIRY);
    EXPECT_EQ(grant("0xkey1", {}, kNow - 1).error, ErrorCode::INVALID_EXPIRY);
    EXPECT_TRUE(grant("0xkey1", {}, kNow + 1).success);
}

TEST_F(SessionKeyServiceTest, Grant_ExistingPair_AlreadyExists) {
    ASSERT_TRUE(grant("0xkey1").success);

    auto result = grant("0xkey1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(publisher_->publishCallCount(), 1);
}

TEST_F(SessionKeyServiceTest, Grant_RevokedPairIsNotRevived) {
    grant("0xkey1");
    service_->revoke(kAccount, "0xkey1", kNow);

    EXPECT_EQ(grant("0xkey1").error, ErrorCode::ALREADY_EXISTS);
    EXPECT_FALSE(stored("0xkey1").isActive);
}

TEST_F(SessionKeyServiceTest, Grant_SameKeyIdForDifferentAccounts) {
    grant("0xkey1");

    ports::input::GrantRequest request;
    request.accountId = "0xother";
    request.keyId = "0xkey1";
    request.spendingLimit = kTenthEth;
    request.dailyLimit = kEth;
    request.expiryTime = kNow + 3600;

    EXPECT_TRUE(service_->grant(request, kNow).success);
    EXPECT_EQ(repository_->size(), 2u);
}

TEST_F(SessionKeyServiceTest, Grant_DuplicateTargetsCollapse) {
    grant("0xkey1", {"0xT1", "0xT1", "0xT2"});
    EXPECT_EQ(stored("0xkey1").allowedTargets.size(), 2u);
}

// ============================================
// REVOKE
// ============================================

TEST_F(SessionKeyServiceTest, Revoke_Unknown_NotFound) {
    auto result = service_->revoke(kAccount, "0xmissing", kNow);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
}

TEST_F(SessionKeyServiceTest, Revoke_DeactivatesAndRetainsRecord) {
    grant("0xkey1");

    auto result = service_->revoke(kAccount, "0xkey1", kNow);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.changed);
    auto key = stored("0xkey1");
    EXPECT_FALSE(key.isActive);
    EXPECT_EQ(key.version, 2u);
    EXPECT_EQ(publisher_->messagesWithKey("session_key.revoked").size(), 1u);
}

TEST_F(SessionKeyServiceTest, Revoke_Twice_NoDuplicateEvent) {
    grant("0xkey1");
    service_->revoke(kAccount, "0xkey1", kNow);

    auto second = service_->revoke(kAccount, "0xkey1", kNow + 10);

    EXPECT_TRUE(second.success);
    EXPECT_FALSE(second.changed);
    EXPECT_EQ(stored("0xkey1").version, 2u);
    EXPECT_EQ(publisher_->messagesWithKey("session_key.revoked").size(), 1u);
}

TEST_F(SessionKeyServiceTest, Revoke_IsFinalForAuthorizeAndCheck) {
    grant("0xkey1");
    service_->revoke(kAccount, "0xkey1", kNow);

    EXPECT_EQ(authorize("0xkey1", Amount(1)).reason, DenialReason::SESSION_KEY_INACTIVE);
    EXPECT_EQ(service_->checkValidity(kAccount, "0xkey1", "0xdex", Amount(1), kNow).reason,
              DenialReason::SESSION_KEY_INACTIVE);
}

// ============================================
// UPDATE LIMITS
// ============================================

TEST_F(SessionKeyServiceTest, UpdateLimits_Unknown_NotFoundBeforeInvalidLimits) {
    auto result = service_->updateLimits(kAccount, "0xmissing", kEth, kTenthEth, kNow);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
}

TEST_F(SessionKeyServiceTest, UpdateLimits_DailyBelowSpending_InvalidLimits) {
    grant("0xkey1");

    auto result = service_->updateLimits(kAccount, "0xkey1", kEth, kTenthEth, kNow);

    EXPECT_EQ(result.error, ErrorCode::INVALID_LIMITS);
    EXPECT_EQ(stored("0xkey1").dailyLimit, kEth);
    EXPECT_EQ(stored("0xkey1").version, 1u);
}

TEST_F(SessionKeyServiceTest, UpdateLimits_KeepsUsedToday) {
    grant("0xkey1");
    authorize("0xkey1", kTenthEth);

    auto result = service_->updateLimits(kAccount, "0xkey1", kTenthEth * 2, kEth * 2, kNow);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.sessionKey->usedToday, kTenthEth);
    EXPECT_EQ(result.sessionKey->spendingLimit, kTenthEth * 2);
    EXPECT_EQ(result.sessionKey->dailyLimit, kEth * 2);

    auto events = publisher_->messagesWithKey("session_key.limits_updated");
    ASSERT_EQ(events.size(), 1u);
    auto j = nlohmann::json::parse(events[0].message);
    EXPECT_EQ(j["oldDailyLimit"], "1000000000000000000");
    EXPECT_EQ(j["newDailyLimit"], "2000000000000000000");
}

TEST_F(SessionKeyServiceTest, UpdateLimits_BelowUsedToday_ClampsUsage) {
    grant("0xkey1");
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(authorize("0xkey1", kTenthEth).allowed);
    }

    auto result = service_->updateLimits(kAccount, "0xkey1", kTenthEth, kTenthEth * 3, kNow);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.sessionKey->usedToday, kTenthEth * 3);
    EXPECT_NO_THROW(verifyInvariants(stored("0xkey1")));
    EXPECT_EQ(authorize("0xkey1", Amount(1)).reason, DenialReason::DAILY_LIMIT_EXCEEDED);
}

// ============================================
// EXTEND EXPIRY
// ============================================

TEST_F(SessionKeyServiceTest, ExtendExpiry_Unknown_NotFound) {
    EXPECT_EQ(service_->extendExpiry(kAccount, "0xmissing", kNow + 7200, kNow).error,
              ErrorCode::NOT_FOUND);
}

TEST_F(SessionKeyServiceTest, ExtendExpiry_MustMoveForward) {
    grant("0xkey1");

    EXPECT_EQ(service_->extendExpiry(kAccount, "0xkey1", kNow + 3600, kNow).error,
              ErrorCode::INVALID_EXPIRY);
    EXPECT_EQ(service_->extendExpiry(kAccount, "0xkey1", kNow + 1800, kNow).error,
              ErrorCode::INVALID_EXPIRY);
    EXPECT_EQ(stored("0xkey1").expiryTime, kNow + 3600);
}

TEST_F(SessionKeyServiceTest, ExtendExpiry_MustBeInFuture) {
    grant("0xkey1", {}, kNow + 10);

    // Срок уже истёк, новое значение больше старого, но не в будущем
    auto result = service_->extendExpiry(kAccount, "0xkey1", kNow + 20, kNow + 30);
    EXPECT_EQ(result.error, ErrorCode::INVALID_EXPIRY);
}

TEST_F(SessionKeyServiceTest, ExtendExpiry_RestoresUsabilityOfExpiredKey) {
    grant("0xkey1", {}, kNow + 10);
    EXPECT_EQ(authorize("0xkey1", Amount(1), kNow + 20).reason, DenialReason::SESSION_KEY_EXPIRED);

    auto result = service_->extendExpiry(kAccount, "0xkey1", kNow + 3600, kNow + 20);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(authorize("0xkey1", Amount(1), kNow + 20).allowed);

    auto events = publisher_->messagesWithKey("session_key.expiry_extended");
    ASSERT_EQ(events.size(), 1u);
    auto j = nlohmann::json::parse(events[0].message);
    EXPECT_EQ(j["oldExpiryTime"], kNow + 10);
    EXPECT_EQ(j["newExpiryTime"], kNow + 3600);
}

TEST_F(SessionKeyServiceTest, ExtendExpiry_DoesNotReactivateRevokedKey) {
    grant("0xkey1");
    service_->revoke(kAccount, "0xkey1", kNow);

    ASSERT_TRUE(service_->extendExpiry(kAccount, "0xkey1", kNow + 7200, kNow).success);
    EXPECT_FALSE(stored("0xkey1").isActive);
    EXPECT_EQ(authorize("0xkey1", Amount(1)).reason, DenialReason::SESSION_KEY_INACTIVE);
}

// ============================================
// EMERGENCY REVOKE ALL
// ============================================

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_RevokesEveryActiveKey) {
    grant("0xkey1");
    grant("0xkey2");

    auto result = service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.revokedCount, 2u);
    EXPECT_EQ(result.revokedKeys, (std::vector<std::string>{"0xkey1", "0xkey2"}));
    EXPECT_TRUE(service_->listActive(kAccount).empty());
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_EmitsOneAggregateEvent) {
    grant("0xkey1");
    grant("0xkey2");
    grant("0xkey3");
    service_->revoke(kAccount, "0xkey3", kNow);
    publisher_->clearMessages();

    service_->emergencyRevokeAll(kAccount, kNow);

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "session_key.emergency_revoke_all");
    auto j = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(j["revokedCount"], 2);
    EXPECT_EQ(j["revokedKeys"].size(), 2u);
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_NoActiveKeys_ZeroCount) {
    auto result = service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.revokedCount, 0u);
    EXPECT_EQ(publisher_->messagesWithKey("session_key.emergency_revoke_all").size(), 1u);
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_OtherAccountsUntouched) {
    grant("0xkey1");

    ports::input::GrantRequest request;
    request.accountId = "0xother";
    request.keyId = "0xkey1";
    request.spendingLimit = kTenthEth;
    request.dailyLimit = kEth;
    request.expiryTime = kNow + 3600;
    service_->grant(request, kNow);

    service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_EQ(service_->listActive("0xother"), (std::vector<std::string>{"0xkey1"}));
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_CorruptedKeyDoesNotStopTheRest) {
    grant("0xkey1");
    grant("0xkey2");
    grant("0xkey3");
    auto corrupted = stored("0xkey2");
    corrupted.spendingLimit = corrupted.dailyLimit + 1;
    repository_->put(corrupted);
    publisher_->clearMessages();

    auto result = service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.revokedKeys, (std::vector<std::string>{"0xkey1", "0xkey2", "0xkey3"}));
    EXPECT_TRUE(result.failedKeys.empty());
    EXPECT_TRUE(service_->listActive(kAccount).empty());

    auto events = publisher_->messagesWithKey("session_key.emergency_revoke_all");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(events[0].message)["revokedCount"], 3);
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_CommitFailureReportedAndOthersRevoked) {
    grant("0xkey1");
    grant("0xkey2");
    grant("0xkey3");
    publisher_->clearMessages();

    // Все попытки по первому ключу проигрывают гонку
    repository_->injectConflicts(3);

    auto result = service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::REVOKE_INCOMPLETE);
    EXPECT_EQ(result.revokedCount, 2u);
    EXPECT_EQ(result.revokedKeys, (std::vector<std::string>{"0xkey2", "0xkey3"}));
    EXPECT_EQ(result.failedKeys, (std::vector<std::string>{"0xkey1"}));
    EXPECT_EQ(service_->listActive(kAccount), (std::vector<std::string>{"0xkey1"}));

    // Событие отражает ровно зафиксированные отзывы
    auto events = publisher_->messagesWithKey("session_key.emergency_revoke_all");
    ASSERT_EQ(events.size(), 1u);
    auto j = nlohmann::json::parse(events[0].message);
    EXPECT_EQ(j["revokedCount"], 2);
    EXPECT_EQ(j["revokedKeys"], nlohmann::json::array({"0xkey2", "0xkey3"}));
    EXPECT_EQ(j["failedKeys"], nlohmann::json::array({"0xkey1"}));
}

TEST_F(SessionKeyServiceTest, EmergencyRevokeAll_ZeroAccount_InvalidAccount) {
    EXPECT_EQ(service_->emergencyRevokeAll("", kNow).error, ErrorCode::INVALID_ACCOUNT);
}

// ============================================
// QUERIES
// ============================================

TEST_F(SessionKeyServiceTest, Get_ReturnsRecordOrNotFound) {
    grant("0xkey1");

    auto found = service_->get(kAccount, "0xkey1");
    ASSERT_TRUE(found.success);
    EXPECT_EQ(found.sessionKey->keyId, "0xkey1");

    EXPECT_EQ(service_->get(kAccount, "0xmissing").error, ErrorCode::NOT_FOUND);
}

TEST_F(SessionKeyServiceTest, ListActive_IgnoresExpiryButNotRevocation) {
    grant("0xkey2", {}, kNow + 10);
    grant("0xkey1");
    grant("0xkey3");
    service_->revoke(kAccount, "0xkey3", kNow);

    // Ключ с истёкшим сроком остаётся "активным"
    EXPECT_EQ(service_->listActive(kAccount), (std::vector<std::string>{"0xkey1", "0xkey2"}));
}

TEST_F(SessionKeyServiceTest, ListAll_IncludesRevokedRecords) {
    grant("0xkey1");
    grant("0xkey2");
    service_->revoke(kAccount, "0xkey2", kNow);

    auto all = service_->listAll(kAccount);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].keyId, "0xkey1");
    EXPECT_FALSE(all[1].isActive);
}

TEST_F(SessionKeyServiceTest, GetUsage_ReportsBudget) {
    grant("0xkey1");
    authorize("0xkey1", kTenthEth);

    auto result = service_->getUsage(kAccount, "0xkey1", kNow + 600);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.usage->usedToday, kTenthEth);
    EXPECT_EQ(result.usage->remainingDaily, kEth - kTenthEth);
    EXPECT_EQ(result.usage->remainingPerTx, kTenthEth);
    EXPECT_EQ(result.usage->timeUntilExpiry, 3000);
}

TEST_F(SessionKeyServiceTest, GetUsage_VirtualResetNotPersisted) {
    grant("0xkey1", {}, kNow + 3 * kSecondsPerDay);
    authorize("0xkey1", kTenthEth);

    auto result = service_->getUsage(kAccount, "0xkey1", kNow + kSecondsPerDay);

    EXPECT_EQ(result.usage->usedToday, Amount(0));
    EXPECT_EQ(stored("0xkey1").usedToday, kTenthEth);
    EXPECT_EQ(stored("0xkey1").lastUsedDay, kDay);
}

TEST_F(SessionKeyServiceTest, GetUsage_Unknown_NotFound) {
    EXPECT_EQ(service_->getUsage(kAccount, "0xmissing", kNow).error, ErrorCode::NOT_FOUND);
}

// ============================================
// AUTHORIZATION
// ============================================

TEST_F(SessionKeyServiceTest, Authorize_UnknownKey_SessionKeyNotFound) {
    auto decision = authorize("0xmissing", Amount(1));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenialReason::SESSION_KEY_NOT_FOUND);
}

TEST_F(SessionKeyServiceTest, Authorize_RecordsUsageAndEmitsEvent) {
    grant("0xkey1");

    auto decision = authorize("0xkey1", kTenthEth);

    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(stored("0xkey1").usedToday, kTenthEth);
    EXPECT_EQ(stored("0xkey1").version, 2u);

    auto events = publisher_->messagesWithKey("session_key.used");
    ASSERT_EQ(events.size(), 1u);
    auto j = nlohmann::json::parse(events[0].message);
    EXPECT_EQ(j["target"], "0xdex");
    EXPECT_EQ(j["value"], "100000000000000000");
    EXPECT_EQ(j["usedToday"], "100000000000000000");
    EXPECT_EQ(j["version"], 2);
}

TEST_F(SessionKeyServiceTest, Authorize_DenialDoesNotMutateOrEmit) {
    grant("0xkey1");
    publisher_->clearMessages();

    auto decision = authorize("0xkey1", kEth);

    EXPECT_EQ(decision.reason, DenialReason::SPENDING_LIMIT_EXCEEDED);
    EXPECT_EQ(stored("0xkey1").version, 1u);
    EXPECT_EQ(stored("0xkey1").usedToday, Amount(0));
    EXPECT_EQ(publisher_->publishCallCount(), 0);
    EXPECT_EQ(repository_->updateCalls(), 0);
}

TEST_F(SessionKeyServiceTest, DayRollover) {
    grant("0xkey1", {}, kNow + 2 * kSecondsPerDay);
    auto key = stored("0xkey1");
    key.usedToday = kTenthEth * 9;
    key.spendingLimit = kTenthEth * 2;
    repository_->put(key);

    auto sameDay = authorize("0xkey1", kTenthEth * 2);
    EXPECT_EQ(sameDay.reason, DenialReason::DAILY_LIMIT_EXCEEDED);

    auto nextDay = authorize("0xkey1", kTenthEth * 2, (kDay + 1) * kSecondsPerDay);
    EXPECT_TRUE(nextDay.allowed);

    auto after = stored("0xkey1");
    EXPECT_EQ(after.usedToday, kTenthEth * 2);
    EXPECT_EQ(after.lastUsedDay, kDay + 1);
}

TEST_F(SessionKeyServiceTest, PerTxCap) {
    grant("0xkey1");

    auto decision = authorize("0xkey1", kTenthEth * 2);

    EXPECT_EQ(decision.reason, DenialReason::SPENDING_LIMIT_EXCEEDED);
    EXPECT_EQ(decision.limit, kTenthEth);
    EXPECT_EQ(decision.attempted, kTenthEth * 2);
}

TEST_F(SessionKeyServiceTest, TargetAllowList) {
    grant("0xkey1", {"0xT1"});

    EXPECT_EQ(authorize("0xkey1", kTenthEth, kNow, "0xT2").reason, DenialReason::TARGET_NOT_ALLOWED);
    EXPECT_TRUE(authorize("0xkey1", kTenthEth, kNow, "0xT1").allowed);
}

TEST_F(SessionKeyServiceTest, ExpiryBoundary) {
    grant("0xkey1", {}, kNow + 1);

    EXPECT_TRUE(authorize("0xkey1", Amount(1), kNow).allowed);
    EXPECT_EQ(authorize("0xkey1", Amount(1), kNow + 1).reason, DenialReason::SESSION_KEY_EXPIRED);
    EXPECT_EQ(authorize("0xkey1", Amount(1), kNow + 2).reason, DenialReason::SESSION_KEY_EXPIRED);
}

TEST_F(SessionKeyServiceTest, EndToEnd_TenAuthorizationsExhaustDailyBudget) {
    grant("0xkey1");

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(authorize("0xkey1", kTenthEth, kNow + i).allowed) << "authorization " << i;
    }

    auto eleventh = authorize("0xkey1", kTenthEth, kNow + 10);
    EXPECT_FALSE(eleventh.allowed);
    EXPECT_EQ(eleventh.reason, DenialReason::DAILY_LIMIT_EXCEEDED);
    EXPECT_EQ(stored("0xkey1").usedToday, kEth);
}

// ============================================
// CHECK VALIDITY
// ============================================

TEST_F(SessionKeyServiceTest, CheckValidity_NeverChangesState) {
    grant("0xkey1", {}, kNow + 3 * kSecondsPerDay);
    authorize("0xkey1", kTenthEth);
    auto before = stored("0xkey1");
    int updatesBefore = repository_->updateCalls();
    publisher_->clearMessages();

    for (int i = 0; i < 5; ++i) {
        service_->checkValidity(kAccount, "0xkey1", "0xdex", kTenthEth, kNow);
        service_->checkValidity(kAccount, "0xkey1", "0xdex", kEth, kNow);
        service_->checkValidity(kAccount, "0xkey1", "0xdex", kTenthEth, kNow + kSecondsPerDay);
    }

    auto after = stored("0xkey1");
    EXPECT_EQ(after.usedToday, before.usedToday);
    EXPECT_EQ(after.lastUsedDay, before.lastUsedDay);
    EXPECT_EQ(after.version, before.version);
    EXPECT_EQ(repository_->updateCalls(), updatesBefore);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(SessionKeyServiceTest, CheckValidity_MatchesAuthorizeDecision) {
    grant("0xkey1", {"0xT1"}, kNow + 100);
    auto key = stored("0xkey1");
    key.usedToday = kEth - kTenthEth;
    repository_->put(key);

    struct Probe {
        std::string keyId;
        std::string target;
        Amount value;
        UnixTime now;
    };
    const std::vector<Probe> probes = {
        {"0xmissing", "0xT1", Amount(1), kNow},
        {"0xkey1", "0xT2", Amount(1), kNow},
        {"0xkey1", "0xT1", kTenthEth * 2, kNow},
        {"0xkey1", "0xT1", kTenthEth, kNow + 100},
        {"0xkey1", "0xT1", kTenthEth, kNow},
        {"0xkey1", "0xT1", Amount(1), kNow},
    };

    for (const auto& probe : probes) {
        auto check = service_->checkValidity(kAccount, probe.keyId, probe.target, probe.value, probe.now);
        auto auth = service_->authorize(kAccount, probe.keyId, probe.target, probe.value, probe.now);
        EXPECT_EQ(check.allowed, auth.allowed) << probe.keyId << " " << probe.target;
        EXPECT_EQ(check.reason, auth.reason) << probe.keyId << " " << probe.target;
    }
}

// ============================================
// EVENTS
// ============================================

TEST_F(SessionKeyServiceTest, Events_FollowMutationOrderPerRecord) {
    grant("0xkey1");
    authorize("0xkey1", kTenthEth);
    service_->updateLimits(kAccount, "0xkey1", kTenthEth, kEth * 2, kNow);
    service_->extendExpiry(kAccount, "0xkey1", kNow + 7200, kNow);
    service_->revoke(kAccount, "0xkey1", kNow);

    EXPECT_EQ(routingKeys(), (std::vector<std::string>{
        "session_key.granted",
        "session_key.used",
        "session_key.limits_updated",
        "session_key.expiry_extended",
        "session_key.revoked"}));

    std::uint64_t expectedVersion = 1;
    for (const auto& m : publisher_->getPublishedMessages()) {
        auto j = nlohmann::json::parse(m.message);
        EXPECT_EQ(j["version"], expectedVersion) << m.routingKey;
        ++expectedVersion;
    }
}

TEST_F(SessionKeyServiceTest, Events_PublishFailureKeepsCommittedMutation) {
    grant("0xkey1");
    publisher_->setFailing(true);

    auto decision = authorize("0xkey1", kTenthEth);

    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(stored("0xkey1").usedToday, kTenthEth);
}

// ============================================
// INVARIANTS & OPTIMISTIC CONCURRENCY
// ============================================

TEST_F(SessionKeyServiceTest, CorruptedRecord_SurfacesInvariantViolation) {
    grant("0xkey1");
    auto key = stored("0xkey1");
    key.spendingLimit = key.dailyLimit + 1;
    repository_->put(key);

    EXPECT_THROW(authorize("0xkey1", Amount(1)), InvariantViolation);
    EXPECT_THROW(service_->checkValidity(kAccount, "0xkey1", "0xdex", Amount(1), kNow), InvariantViolation);
    EXPECT_THROW(service_->get(kAccount, "0xkey1"), InvariantViolation);
}

TEST_F(SessionKeyServiceTest, CorruptedRecord_CanStillBeRevoked) {
    grant("0xkey1");
    auto key = stored("0xkey1");
    key.spendingLimit = key.dailyLimit + 1;
    repository_->put(key);

    auto result = service_->revoke(kAccount, "0xkey1", kNow);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.changed);
    EXPECT_FALSE(stored("0xkey1").isActive);
}

TEST_F(SessionKeyServiceTest, VersionConflict_RetriesAndCommits) {
    grant("0xkey1");
    repository_->injectConflicts(2);

    auto decision = authorize("0xkey1", kTenthEth);

    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(repository_->updateCalls(), 3);
    EXPECT_EQ(stored("0xkey1").usedToday, kTenthEth);
    EXPECT_EQ(publisher_->messagesWithKey("session_key.used").size(), 1u);
}

TEST_F(SessionKeyServiceTest, VersionConflict_ReevaluatesAgainstForeignWrite) {
    grant("0xkey1");
    auto key = stored("0xkey1");
    key.usedToday = kEth - kTenthEth * 2;
    repository_->put(key);

    // Другой экземпляр успел потратить остаток бюджета
    repository_->injectConflicts(1, [this](SessionKey& record) {
        record.usedToday = kEth - kTenthEth / 2;
    });

    auto decision = authorize("0xkey1", kTenthEth);

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenialReason::DAILY_LIMIT_EXCEEDED);
    EXPECT_EQ(stored("0xkey1").usedToday, kEth - kTenthEth / 2);
    EXPECT_EQ(publisher_->messagesWithKey("session_key.used").size(), 0u);
}

TEST_F(SessionKeyServiceTest, VersionConflict_ExhaustedAttemptsThrow) {
    grant("0xkey1");
    repository_->injectConflicts(3);

    EXPECT_THROW(authorize("0xkey1", kTenthEth), ConcurrentModificationError);
    EXPECT_EQ(stored("0xkey1").usedToday, Amount(0));
    EXPECT_EQ(publisher_->messagesWithKey("session_key.used").size(), 0u);
}

TEST_F(SessionKeyServiceTest, LockTable_UnknownKeysDoNotGrowIt) {
    for (int i = 0; i < 1000; ++i) {
        std::string keyId = "0xghost" + std::to_string(i);
        EXPECT_EQ(authorize(keyId, Amount(1)).reason, DenialReason::SESSION_KEY_NOT_FOUND);
        EXPECT_EQ(service_->revoke(kAccount, keyId, kNow).error, ErrorCode::NOT_FOUND);
        EXPECT_EQ(service_->updateLimits(kAccount, keyId, Amount(1), Amount(2), kNow).error,
                  ErrorCode::NOT_FOUND);
        EXPECT_EQ(service_->extendExpiry(kAccount, keyId, kNow + 7200, kNow).error,
                  ErrorCode::NOT_FOUND);
    }

    EXPECT_EQ(service_->trackedRecordCount(), 0u);
}

TEST_F(SessionKeyServiceTest, LockTable_OneCellPerExistingRecord) {
    grant("0xkey1");
    grant("0xkey2");

    authorize("0xkey1", Amount(1));
    authorize("0xkey1", Amount(1));
    service_->revoke(kAccount, "0xkey2", kNow);
    service_->emergencyRevokeAll(kAccount, kNow);

    EXPECT_EQ(service_->trackedRecordCount(), 2u);
}

TEST_F(SessionKeyServiceTest, ModuleMetadata) {
    EXPECT_STREQ(application::SessionKeyService::kModuleName, "SessionKeyModule");
    EXPECT_STREQ(application::SessionKeyService::kModuleVersion, "1.0.0");
}
