/**
 * @file test_license_record.cpp
 * @brief Tests for license record serialization, signing and sealing
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseRecord.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace Varsys;
using namespace Varsys::License;
using namespace Varsys::Testing;

namespace {

const std::string APP_SECRET = "test-app-secret-0123456789";
const std::string FINGERPRINT = "0123456789abcdef0123456789abcdef";

LicenseRecord sampleRecord() {
    LicenseRecord record;
    record.user_id = "5f0c6a2e-8d1b-4c7a-9e3f-2b6d8a1c4e90";
    record.email = "a@b.com";
    record.license_key = "VARSYS-AAAA-BBBB-CCCC-DDDD";
    record.machine_fingerprint = FINGERPRINT;
    record.license_type = "commercial";
    record.features = {"firebase_sync", "export"};
    record.activated_at = 1735689600;
    record.expires_at = 1735689600 + 365 * SECONDS_PER_DAY;
    record.last_online_check = 1735689600;
    return record;
}

LicenseRecord signedRecord() {
    LicenseRecord record = sampleRecord();
    auto signature = signRecord(record, APP_SECRET);
    EXPECT_TRUE(signature.isSuccess());
    record.signature = signature.value();
    return record;
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

TEST(LicenseRecord, CanonicalJson_ExcludesSignatureWithSortedKeys) {
    LicenseRecord record = signedRecord();
    std::string canonical = record.canonicalJson();
    
    EXPECT_EQ(canonical.find("signature"), std::string::npos);
    EXPECT_LT(canonical.find("\"activated_at\""), canonical.find("\"email\""));
    EXPECT_LT(canonical.find("\"email\""), canonical.find("\"user_id\""));
}

TEST(LicenseRecord, JsonRoundTrip_PreservesEveryField) {
    LicenseRecord record = signedRecord();
    
    auto parsed = LicenseRecord::fromJson(record.toJson());
    ASSERT_RESULT_OK(parsed);
    
    const LicenseRecord& copy = parsed.value();
    EXPECT_EQ(copy.user_id, record.user_id);
    EXPECT_EQ(copy.email, record.email);
    EXPECT_EQ(copy.license_key, record.license_key);
    EXPECT_EQ(copy.machine_fingerprint, record.machine_fingerprint);
    EXPECT_EQ(copy.license_type, record.license_type);
    EXPECT_EQ(copy.features, record.features);
    EXPECT_EQ(copy.activated_at, record.activated_at);
    EXPECT_EQ(copy.expires_at, record.expires_at);
    EXPECT_EQ(copy.last_online_check, record.last_online_check);
    EXPECT_EQ(copy.signature, record.signature);
}

TEST(LicenseRecord, FromJson_RejectsMalformedInput) {
    EXPECT_ERROR(LicenseRecord::fromJson("{not json"), ErrorCode::JsonParseFailed);
    EXPECT_ERROR(LicenseRecord::fromJson("[1,2,3]"), ErrorCode::JsonInvalid);
    
    auto missing = nlohmann::json::parse(signedRecord().toJson());
    missing.erase("expires_at");
    EXPECT_ERROR(LicenseRecord::fromJson(missing.dump()), ErrorCode::MissingField);
    
    auto wrongType = nlohmann::json::parse(signedRecord().toJson());
    wrongType["activated_at"] = "yesterday";
    EXPECT_ERROR(LicenseRecord::fromJson(wrongType.dump()), ErrorCode::InvalidFieldType);
}

// ============================================================================
// Features and Expiry
// ============================================================================

TEST(LicenseRecord, Grants_IssuedFeaturesOnly) {
    LicenseRecord record = sampleRecord();
    
    EXPECT_TRUE(record.grants("firebase_sync"));
    EXPECT_TRUE(record.grants("export"));
    EXPECT_FALSE(record.grants("admin"));
}

TEST(LicenseRecord, FullAccess_GrantsEverything) {
    LicenseRecord record = sampleRecord();
    record.features = {FEATURE_FULL_ACCESS};
    
    EXPECT_TRUE(record.grants("firebase_sync"));
    EXPECT_TRUE(record.grants("anything_else"));
}

TEST(LicenseRecord, IsExpired_OnlyAfterExpiryInstant) {
    LicenseRecord record = sampleRecord();
    
    EXPECT_FALSE(record.isExpired(record.expires_at - 1));
    EXPECT_FALSE(record.isExpired(record.expires_at));
    EXPECT_TRUE(record.isExpired(record.expires_at + 1));
}

// ============================================================================
// Signatures
// ============================================================================

TEST(LicenseSignature, ValidSignatureVerifies) {
    EXPECT_TRUE(verifyRecordSignature(signedRecord(), APP_SECRET));
}

TEST(LicenseSignature, AnyFieldChange_Invalidates) {
    LicenseRecord record = signedRecord();
    record.expires_at += SECONDS_PER_DAY;
    EXPECT_FALSE(verifyRecordSignature(record, APP_SECRET));
    
    record = signedRecord();
    record.features.insert(FEATURE_FULL_ACCESS);
    EXPECT_FALSE(verifyRecordSignature(record, APP_SECRET));
    
    record = signedRecord();
    record.machine_fingerprint = "ffffffffffffffffffffffffffffffff";
    EXPECT_FALSE(verifyRecordSignature(record, APP_SECRET));
}

TEST(LicenseSignature, WrongSecret_Invalidates) {
    EXPECT_FALSE(verifyRecordSignature(signedRecord(), "another-app-secret"));
}

// ============================================================================
// Sealing
// ============================================================================

TEST(LicenseSealing, SealThenOpen_RecoversRecord) {
    LicenseRecord record = signedRecord();
    
    auto sealed = sealRecord(record, APP_SECRET, FINGERPRINT);
    ASSERT_RESULT_OK(sealed);
    EXPECT_EQ(sealed.value().find("a@b.com"), std::string::npos);
    
    auto opened = openRecord(sealed.value(), APP_SECRET, FINGERPRINT);
    ASSERT_RESULT_OK(opened);
    EXPECT_EQ(opened.value().toJson(), record.toJson());
}

TEST(LicenseSealing, SealingIsRandomized) {
    LicenseRecord record = signedRecord();
    
    auto a = sealRecord(record, APP_SECRET, FINGERPRINT);
    auto b = sealRecord(record, APP_SECRET, FINGERPRINT);
    ASSERT_RESULT_OK(a);
    ASSERT_RESULT_OK(b);
    EXPECT_NE(a.value(), b.value());
}

TEST(LicenseSealing, OtherMachine_CannotOpen) {
    auto sealed = sealRecord(signedRecord(), APP_SECRET, FINGERPRINT);
    ASSERT_RESULT_OK(sealed);
    
    EXPECT_ERROR(openRecord(sealed.value(), APP_SECRET, "ffffffffffffffffffffffffffffffff"),
                 ErrorCode::LicenseTampered);
}

TEST(LicenseSealing, CorruptedText_Tampered) {
    auto sealed = sealRecord(signedRecord(), APP_SECRET, FINGERPRINT);
    ASSERT_RESULT_OK(sealed);
    
    std::string corrupted = sealed.value();
    corrupted[corrupted.size() / 2] = (corrupted[corrupted.size() / 2] == 'A') ? 'B' : 'A';
    EXPECT_ERROR(openRecord(corrupted, APP_SECRET, FINGERPRINT), ErrorCode::LicenseTampered);
    
    EXPECT_ERROR(openRecord("not base64!", APP_SECRET, FINGERPRINT), ErrorCode::LicenseTampered);
    EXPECT_ERROR(openRecord("", APP_SECRET, FINGERPRINT), ErrorCode::LicenseTampered);
}

TEST(LicenseSealing, InvalidUtf8Field_JsonInvalid) {
    LicenseRecord record = sampleRecord();
    record.email = "a\xff@b.com";
    
    EXPECT_ERROR(signRecord(record, APP_SECRET), ErrorCode::JsonInvalid);
    EXPECT_ERROR(sealRecord(record, APP_SECRET, FINGERPRINT), ErrorCode::JsonInvalid);
}
