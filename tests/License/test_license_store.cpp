/**
 * @file test_license_store.cpp
 * @brief Tests for license activation, verification and online re-validation
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseStore.hpp>
#include <Varsys/Audit/AccessLog.hpp>
#include <Varsys/Core/FileStore.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

using namespace Varsys;
using namespace Varsys::License;
using namespace Varsys::Testing;

namespace {

const std::string FINGERPRINT = "0123456789abcdef0123456789abcdef";
const std::string OTHER_FINGERPRINT = "fedcba9876543210fedcba9876543210";
const std::string LICENSE_KEY = "VARSYS-AAAA-BBBB-CCCC-DDDD";
const std::string EMAIL = "a@b.com";

/// Issues licenses bound to a machine other than the requester
class MisbindingAuthority : public InMemoryLicenseAuthority {
public:
    using InMemoryLicenseAuthority::InMemoryLicenseAuthority;
    
    Result<LicenseRecord> activate(const ActivationRequest& request) override {
        auto issued = InMemoryLicenseAuthority::activate(request);
        if (issued.isSuccess()) {
            issued.value().machine_fingerprint = OTHER_FINGERPRINT;
        }
        return issued;
    }
};

/// Holds revalidate() open until the test releases it
class BlockingAuthority : public InMemoryLicenseAuthority {
public:
    using InMemoryLicenseAuthority::InMemoryLicenseAuthority;
    
    Result<void> revalidate(const RevalidationRequest& request) override {
        std::call_once(m_enteredOnce, [this]() { m_entered.set_value(); });
        m_released.wait();
        return InMemoryLicenseAuthority::revalidate(request);
    }
    
    bool waitUntilEntered() {
        return m_enteredFuture.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    }
    
    void release() {
        std::call_once(m_releaseOnce, [this]() { m_release.set_value(); });
    }

private:
    std::promise<void> m_entered;
    std::future<void> m_enteredFuture = m_entered.get_future();
    std::once_flag m_enteredOnce;
    std::promise<void> m_release;
    std::shared_future<void> m_released = m_release.get_future().share();
    std::once_flag m_releaseOnce;
};

} // namespace

class LicenseStoreTest : public ::testing::Test {
protected:
    LicenseStoreTest()
        : settings(makeTestSettings(temp.path()))
        , authority(std::make_shared<InMemoryLicenseAuthority>(clock.source()))
        , accessLog(settings.accessLogPath(), FINGERPRINT)
        , store(settings, MachineBinding{FINGERPRINT, "Linux 6.1.0 x86_64"},
                authority, accessLog, clock.source())
    {
    }
    
    void activate() {
        ASSERT_RESULT_OK(store.activate(LICENSE_KEY, EMAIL));
    }
    
    /// Seal a hand-built record into the license file for this machine
    void writeCraftedRecord(LicenseRecord record, bool sign) {
        if (sign) {
            auto signature = signRecord(record, settings.appSecret);
            ASSERT_RESULT_OK(signature);
            record.signature = signature.value();
        } else {
            record.signature = std::string(64, '0');
        }
        auto sealed = sealRecord(record, settings.appSecret, FINGERPRINT);
        ASSERT_RESULT_OK(sealed);
        ASSERT_RESULT_OK(IO::writeFileAtomic(settings.licensePath(), asBytes(sealed.value())));
    }
    
    LicenseRecord craftedRecord() const {
        LicenseRecord record;
        record.user_id = "crafted";
        record.email = EMAIL;
        record.license_key = LICENSE_KEY;
        record.machine_fingerprint = FINGERPRINT;
        record.license_type = "commercial";
        record.features = {FEATURE_FULL_ACCESS};
        record.activated_at = clock.now();
        record.expires_at = clock.now() + 365 * SECONDS_PER_DAY;
        record.last_online_check = clock.now();
        return record;
    }
    
    bool auditContains(const std::string& action, bool success) {
        auto entries = accessLog.entries();
        if (entries.isFailure()) {
            return false;
        }
        const auto& list = entries.value();
        return std::any_of(list.begin(), list.end(), [&](const Audit::AuditLogEntry& e) {
            return e.action == action && e.success == success;
        });
    }
    
    TempDirectory temp;
    ManualClock clock;
    Config::Settings settings;
    std::shared_ptr<InMemoryLicenseAuthority> authority;
    Audit::AccessLog accessLog;
    LicenseStore store;
};

// ============================================================================
// Activation
// ============================================================================

TEST_F(LicenseStoreTest, Activate_WritesEncryptedLicense) {
    activate();
    
    ASSERT_TRUE(IO::fileExists(settings.licensePath()));
    std::string onDisk = readFileText(settings.licensePath());
    EXPECT_EQ(onDisk.find(EMAIL), std::string::npos);
    EXPECT_EQ(onDisk.find(LICENSE_KEY), std::string::npos);
    
    auto record = store.verify();
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(record.value().email, EMAIL);
    EXPECT_EQ(record.value().license_key, LICENSE_KEY);
    EXPECT_EQ(record.value().machine_fingerprint, FINGERPRINT);
    EXPECT_EQ(record.value().activated_at, clock.now());
    EXPECT_EQ(record.value().expires_at, clock.now() + 365 * SECONDS_PER_DAY);
    EXPECT_EQ(record.value().last_online_check, record.value().activated_at);
    EXPECT_EQ(record.value().features, InMemoryLicenseAuthority::defaultFeatures());
    
    EXPECT_EQ(store.status(), LicenseState::Active);
    EXPECT_TRUE(auditContains("activate_license", true));
}

TEST_F(LicenseStoreTest, Activate_MalformedKey_NeverContactsAuthority) {
    EXPECT_ERROR(store.activate("SHORT-KEY", EMAIL), ErrorCode::InvalidLicenseFormat);
    EXPECT_ERROR(store.activate("varsys-aaaa-bbbb-cccc-dddd", EMAIL), ErrorCode::InvalidLicenseFormat);
    EXPECT_ERROR(store.activate("OTHER-AAAA-BBBB-CCCC-DDDD", EMAIL), ErrorCode::InvalidLicenseFormat);
    EXPECT_ERROR(store.activate("VARSYS-AAAA BBBB-CCCC-DDDD", EMAIL), ErrorCode::InvalidLicenseFormat);
    
    EXPECT_EQ(authority->activationCount(), 0u);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
    EXPECT_TRUE(auditContains("activate_license", false));
}

TEST_F(LicenseStoreTest, Activate_EmailWithoutAt_Rejected) {
    EXPECT_ERROR(store.activate(LICENSE_KEY, "not-an-email"), ErrorCode::InvalidArgument);
    EXPECT_EQ(authority->activationCount(), 0u);
}

TEST_F(LicenseStoreTest, Activate_EmailNotUtf8_Rejected) {
    EXPECT_ERROR(store.activate(LICENSE_KEY, "a\xff@b.com"), ErrorCode::InvalidArgument);
    EXPECT_ERROR(store.activate(LICENSE_KEY, "\xc0\xaf@b.com"), ErrorCode::InvalidArgument);
    
    EXPECT_EQ(authority->activationCount(), 0u);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
    EXPECT_TRUE(auditContains("activate_license", false));
    
    ASSERT_RESULT_OK(store.activate(LICENSE_KEY, "caf\xc3\xa9@b.com"));
}

TEST_F(LicenseStoreTest, Activate_RevokedKey_ServerRejected) {
    authority->revokeKey(LICENSE_KEY);
    
    EXPECT_ERROR(store.activate(LICENSE_KEY, EMAIL), ErrorCode::ServerRejected);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
    EXPECT_EQ(store.status(), LicenseState::Unactivated);
}

TEST_F(LicenseStoreTest, Activate_AuthorityUnreachable) {
    authority->setActivationUnreachable(true);
    
    EXPECT_ERROR(store.activate(LICENSE_KEY, EMAIL), ErrorCode::AuthorityUnreachable);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
}

TEST_F(LicenseStoreTest, Activate_LicenseIssuedForAnotherMachine_Refused) {
    auto misbinding = std::make_shared<MisbindingAuthority>(clock.source());
    LicenseStore other(settings, MachineBinding{FINGERPRINT, "Linux"}, misbinding,
                       accessLog, clock.source());
    
    EXPECT_ERROR(other.activate(LICENSE_KEY, EMAIL), ErrorCode::MachineMismatch);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
}

TEST_F(LicenseStoreTest, Activate_CreatesMissingDataDirectory) {
    Config::Settings nested = makeTestSettings(temp.file("nested/data"));
    Audit::AccessLog log(temp.file("access.log"), FINGERPRINT);
    LicenseStore nestedStore(nested, MachineBinding{FINGERPRINT, "Linux"}, authority,
                             log, clock.source());
    
    ASSERT_RESULT_OK(nestedStore.activate(LICENSE_KEY, EMAIL));
    EXPECT_TRUE(IO::fileExists(nested.licensePath()));
}

TEST(LicenseKeyFormat, WellFormedKeys) {
    EXPECT_TRUE(LicenseStore::isWellFormedKey("VARSYS-AAAA-BBBB-CCCC-DDDD"));
    EXPECT_TRUE(LicenseStore::isWellFormedKey("VARSYS-0123456789ABCDEF"));
    EXPECT_FALSE(LicenseStore::isWellFormedKey("VARSYS-ABC"));
    EXPECT_FALSE(LicenseStore::isWellFormedKey("VARSYS-aaaa-bbbb-cccc-dddd"));
    EXPECT_FALSE(LicenseStore::isWellFormedKey("XVARSYS-AAAA-BBBB-CCCC"));
    EXPECT_FALSE(LicenseStore::isWellFormedKey(""));
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(LicenseStoreTest, Verify_NoLicense) {
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseNotFound);
    EXPECT_EQ(store.status(), LicenseState::Unactivated);
    EXPECT_FALSE(store.isFeatureEnabled("firebase_sync"));
}

TEST_F(LicenseStoreTest, Verify_ValidUntilExpiryInstant) {
    authority->setValidityDays(30);
    activate();
    
    clock.advanceDays(30);
    ASSERT_RESULT_OK(store.verify());
    
    clock.advanceSeconds(1);
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseExpired);
    EXPECT_EQ(store.status(), LicenseState::Expired);
    EXPECT_FALSE(store.isFeatureEnabled("firebase_sync"));
    EXPECT_TRUE(auditContains("verify_license", false));
}

TEST_F(LicenseStoreTest, Verify_CorruptedFile_Tampered) {
    activate();
    corruptCharacter(settings.licensePath(), 10);
    
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseTampered);
    EXPECT_EQ(store.status(), LicenseState::Tampered);
}

TEST_F(LicenseStoreTest, Verify_TruncatedFile_Tampered) {
    activate();
    std::string contents = readFileText(settings.licensePath());
    writeFileText(settings.licensePath(), contents.substr(0, contents.size() / 2));
    
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseTampered);
}

TEST_F(LicenseStoreTest, Verify_ForgedSignature_Tampered) {
    writeCraftedRecord(craftedRecord(), false);
    
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseTampered);
    EXPECT_FALSE(store.isFeatureEnabled("firebase_sync"));
}

TEST_F(LicenseStoreTest, Verify_RecordBoundToOtherMachine_MachineMismatch) {
    LicenseRecord record = craftedRecord();
    record.machine_fingerprint = OTHER_FINGERPRINT;
    writeCraftedRecord(record, true);
    
    EXPECT_ERROR(store.verify(), ErrorCode::MachineMismatch);
    EXPECT_EQ(store.status(), LicenseState::MachineMismatched);
}

TEST_F(LicenseStoreTest, Verify_FileCopiedToOtherMachine_CannotDecrypt) {
    activate();
    
    LicenseStore elsewhere(settings, MachineBinding{OTHER_FINGERPRINT, "Linux"}, authority,
                           accessLog, clock.source());
    EXPECT_ERROR(elsewhere.verify(), ErrorCode::LicenseTampered);
    ASSERT_RESULT_OK(store.verify());
}

TEST_F(LicenseStoreTest, Verify_TrailingNewlineTolerated) {
    activate();
    std::string contents = readFileText(settings.licensePath());
    writeFileText(settings.licensePath(), contents + "\n");
    
    ASSERT_RESULT_OK(store.verify());
}

// ============================================================================
// Online Re-validation
// ============================================================================

TEST_F(LicenseStoreTest, OnlineCheck_NotDueWithinInterval) {
    activate();
    clock.advanceDays(settings.onlineCheckIntervalDays);
    
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 0u);
}

TEST_F(LicenseStoreTest, OnlineCheck_AcceptedRecordsCheckTime) {
    activate();
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    auto record = store.verify();
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(authority->revalidationCount(), 1u);
    EXPECT_EQ(record.value().last_online_check, clock.now());
    EXPECT_TRUE(auditContains("online_check", true));
    
    // Persisted, so the next verification stays offline
    auto again = store.verify();
    ASSERT_RESULT_OK(again);
    EXPECT_EQ(again.value().last_online_check, clock.now());
    EXPECT_EQ(authority->revalidationCount(), 1u);
}

TEST_F(LicenseStoreTest, OnlineCheck_RejectedFailsVerification) {
    activate();
    authority->setRevalidationMode(InMemoryLicenseAuthority::RevalidationMode::Reject);
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    EXPECT_ERROR(store.verify(), ErrorCode::ServerRejected);
    EXPECT_EQ(store.status(), LicenseState::Rejected);
    EXPECT_FALSE(store.isFeatureEnabled("firebase_sync"));
    EXPECT_TRUE(auditContains("online_check", false));
}

TEST_F(LicenseStoreTest, OnlineCheck_RevokedKeyFailsVerification) {
    activate();
    authority->revokeKey(LICENSE_KEY);
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    EXPECT_ERROR(store.verify(), ErrorCode::ServerRejected);
}

TEST_F(LicenseStoreTest, OnlineCheck_UnreachableFailsOpenWithBackoff) {
    activate();
    authority->setRevalidationMode(InMemoryLicenseAuthority::RevalidationMode::Unreachable);
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 1u);
    EXPECT_TRUE(auditContains("online_check", false));
    
    // Within the backoff window no further attempt is made
    clock.advanceSeconds(60);
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 1u);
    
    clock.advanceSeconds(settings.onlineRetryBackoffMinutes * 60);
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 2u);
    
    // Recovery clears the backoff and records the check
    authority->setRevalidationMode(InMemoryLicenseAuthority::RevalidationMode::Accept);
    clock.advanceSeconds(settings.onlineRetryBackoffMinutes * 60 + 1);
    auto record = store.verify();
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(authority->revalidationCount(), 3u);
    EXPECT_EQ(record.value().last_online_check, clock.now());
}

TEST_F(LicenseStoreTest, OnlineCheck_OversizedIntervalIsCapped) {
    settings.onlineCheckIntervalDays = std::numeric_limits<int64_t>::max();
    settings.onlineRetryBackoffMinutes = std::numeric_limits<int64_t>::max();
    authority->setValidityDays(2 * Config::MAX_ONLINE_CHECK_INTERVAL_DAYS);
    activate();
    
    clock.advanceDays(Config::MAX_ONLINE_CHECK_INTERVAL_DAYS);
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 0u);
    
    authority->setRevalidationMode(InMemoryLicenseAuthority::RevalidationMode::Unreachable);
    clock.advanceDays(1);
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 1u);
    
    clock.advanceSeconds(Config::MAX_ONLINE_RETRY_BACKOFF_MINUTES * 60);
    ASSERT_RESULT_OK(store.verify());
    EXPECT_EQ(authority->revalidationCount(), 2u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(LicenseStoreTest, ConcurrentVerify_OneOnlineCheck) {
    activate();
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    constexpr int THREADS = 8;
    std::vector<std::future<Result<LicenseRecord>>> results;
    for (int i = 0; i < THREADS; ++i) {
        results.push_back(std::async(std::launch::async, [this]() { return store.verify(); }));
    }
    
    for (auto& pending : results) {
        auto record = pending.get();
        ASSERT_RESULT_OK(record);
        EXPECT_EQ(record.value().license_key, LICENSE_KEY);
    }
    EXPECT_EQ(authority->revalidationCount(), 1u);
    
    auto after = store.verify();
    ASSERT_RESULT_OK(after);
    EXPECT_EQ(after.value().last_online_check, clock.now());
}

TEST_F(LicenseStoreTest, OnlineCheck_DoesNotBlockOtherCallers) {
    auto blocking = std::make_shared<BlockingAuthority>(clock.source());
    LicenseStore gated(settings, MachineBinding{FINGERPRINT, "Linux"}, blocking,
                       accessLog, clock.source());
    ASSERT_RESULT_OK(gated.activate(LICENSE_KEY, EMAIL));
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    auto checking = std::async(std::launch::async, [&gated]() { return gated.verify(); });
    if (!blocking->waitUntilEntered()) {
        blocking->release();
        FAIL() << "Online check never reached the authority";
    }
    
    auto other = std::async(std::launch::async, [&gated]() { return gated.verify(); });
    const bool finished = other.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    const LicenseState state = finished ? gated.status() : LicenseState::Unactivated;
    blocking->release();
    
    EXPECT_TRUE(finished) << "verify() waited on another caller's online check";
    EXPECT_EQ(state, LicenseState::Active);
    auto otherResult = other.get();
    ASSERT_RESULT_OK(otherResult);
    auto checked = checking.get();
    ASSERT_RESULT_OK(checked);
    EXPECT_EQ(checked.value().last_online_check, clock.now());
    EXPECT_EQ(blocking->revalidationCount(), 1u);
}

TEST_F(LicenseStoreTest, OnlineCheck_DeactivatedMeanwhile_NotResurrected) {
    auto blocking = std::make_shared<BlockingAuthority>(clock.source());
    LicenseStore gated(settings, MachineBinding{FINGERPRINT, "Linux"}, blocking,
                       accessLog, clock.source());
    ASSERT_RESULT_OK(gated.activate(LICENSE_KEY, EMAIL));
    clock.advanceDays(settings.onlineCheckIntervalDays + 1);
    
    auto checking = std::async(std::launch::async, [&gated]() { return gated.verify(); });
    if (!blocking->waitUntilEntered()) {
        blocking->release();
        FAIL() << "Online check never reached the authority";
    }
    
    auto removed = gated.deactivate();
    blocking->release();
    ASSERT_RESULT_OK(removed);
    
    auto checked = checking.get();
    ASSERT_RESULT_OK(checked);
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
    EXPECT_ERROR(gated.verify(), ErrorCode::LicenseNotFound);
    EXPECT_EQ(gated.status(), LicenseState::Deactivated);
}

// ============================================================================
// Byte-level Tampering
// ============================================================================

TEST_F(LicenseStoreTest, EveryCorruptedByte_Tampered) {
    activate();
    const std::string original = readFileText(settings.licensePath());
    ASSERT_FALSE(original.empty());
    
    for (size_t offset = 0; offset < original.size(); ++offset) {
        corruptCharacter(settings.licensePath(), offset);
        
        auto record = store.verify();
        ASSERT_TRUE(record.isFailure()) << "Corruption at byte " << offset << " went unnoticed";
        EXPECT_TRUE(isTamperError(record.error()))
            << "byte " << offset << ": " << getErrorName(record.error());
        
        writeFileText(settings.licensePath(), original);
    }
    
    ASSERT_RESULT_OK(store.verify());
}

// ============================================================================
// Deactivation, Status and Info
// ============================================================================

TEST_F(LicenseStoreTest, Deactivate_RemovesLicense) {
    activate();
    
    ASSERT_RESULT_OK(store.deactivate());
    EXPECT_FALSE(IO::fileExists(settings.licensePath()));
    EXPECT_ERROR(store.verify(), ErrorCode::LicenseNotFound);
    EXPECT_EQ(store.status(), LicenseState::Deactivated);
    EXPECT_TRUE(auditContains("deactivate_license", true));
    
    EXPECT_ERROR(store.deactivate(), ErrorCode::LicenseNotFound);
}

TEST_F(LicenseStoreTest, Reactivate_AfterDeactivation) {
    activate();
    ASSERT_RESULT_OK(store.deactivate());
    
    activate();
    EXPECT_EQ(store.status(), LicenseState::Active);
    EXPECT_EQ(authority->activationCount(), 2u);
}

TEST_F(LicenseStoreTest, Info_ReportsDaysRemaining) {
    activate();
    
    auto info = store.info();
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().email, EMAIL);
    EXPECT_EQ(info.value().license_type, "commercial");
    EXPECT_EQ(info.value().days_remaining, 365);
    
    clock.advanceDays(10);
    info = store.info();
    ASSERT_RESULT_OK(info);
    EXPECT_EQ(info.value().days_remaining, 355);
}

TEST_F(LicenseStoreTest, Info_WithoutLicense) {
    EXPECT_ERROR(store.info(), ErrorCode::LicenseNotFound);
}

TEST_F(LicenseStoreTest, FeatureGating_FollowsIssuedFeatures) {
    authority->setIssuedFeatures({"reports"});
    activate();
    
    EXPECT_TRUE(store.isFeatureEnabled("reports"));
    EXPECT_FALSE(store.isFeatureEnabled("firebase_sync"));
}

TEST_F(LicenseStoreTest, FeatureGating_FullAccessGrantsAll) {
    authority->setIssuedFeatures({FEATURE_FULL_ACCESS});
    activate();
    
    EXPECT_TRUE(store.isFeatureEnabled("firebase_sync"));
    EXPECT_TRUE(store.isFeatureEnabled("ai_insights"));
}

TEST(LicenseState, Names) {
    EXPECT_STREQ(toString(LicenseState::Active), "active");
    EXPECT_STREQ(toString(LicenseState::Unactivated), "unactivated");
    EXPECT_STREQ(toString(LicenseState::MachineMismatched), "machine-mismatched");
    EXPECT_STREQ(toString(LicenseState::Rejected), "rejected");
}
