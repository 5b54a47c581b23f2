/**
 * @file LicenseRecord.cpp
 * @brief License record serialization, signing and sealing
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseRecord.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/KeyDerivation.hpp>
#include <Varsys/Core/Logger.hpp>

#include <nlohmann/json.hpp>

namespace Varsys::License {

using json = nlohmann::json;
using namespace Varsys::Crypto;

namespace {

json toJsonObject(const LicenseRecord& record) {
    return json{
        {"user_id", record.user_id},
        {"email", record.email},
        {"license_key", record.license_key},
        {"machine_fingerprint", record.machine_fingerprint},
        {"license_type", record.license_type},
        {"features", record.features},
        {"activated_at", record.activated_at},
        {"expires_at", record.expires_at},
        {"last_online_check", record.last_online_check}
    };
}

} // namespace

std::string LicenseRecord::canonicalJson() const {
    return toJsonObject(*this).dump();
}

std::string LicenseRecord::toJson() const {
    json j = toJsonObject(*this);
    j["signature"] = signature;
    return j.dump();
}

Result<LicenseRecord> LicenseRecord::fromJson(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return ErrorCode::JsonParseFailed;
    }
    if (!j.is_object()) {
        return ErrorCode::JsonInvalid;
    }
    
    static const char* const required[] = {
        "user_id", "email", "license_key", "machine_fingerprint", "license_type",
        "features", "activated_at", "expires_at", "last_online_check", "signature"
    };
    for (const char* field : required) {
        if (!j.contains(field)) {
            return ErrorCode::MissingField;
        }
    }
    
    try {
        LicenseRecord record;
        record.user_id = j.at("user_id").get<std::string>();
        record.email = j.at("email").get<std::string>();
        record.license_key = j.at("license_key").get<std::string>();
        record.machine_fingerprint = j.at("machine_fingerprint").get<std::string>();
        record.license_type = j.at("license_type").get<std::string>();
        record.features = j.at("features").get<std::set<std::string>>();
        record.activated_at = j.at("activated_at").get<UnixTime>();
        record.expires_at = j.at("expires_at").get<UnixTime>();
        record.last_online_check = j.at("last_online_check").get<UnixTime>();
        record.signature = j.at("signature").get<std::string>();
        return record;
    } catch (const json::exception&) {
        return ErrorCode::InvalidFieldType;
    }
}

bool LicenseRecord::grants(std::string_view feature) const {
    return features.count(std::string(feature)) > 0 ||
           features.count(FEATURE_FULL_ACCESS) > 0;
}

Result<std::string> signRecord(const LicenseRecord& record, std::string_view appSecret) {
    std::string canonical;
    try {
        canonical = record.canonicalJson();
    } catch (const json::type_error& e) {
        VARSYS_LOG_ERROR_F("License record is not serializable: %s", e.what());
        return ErrorCode::JsonInvalid;
    }
    return HMAC::sha256Hex(appSecret, canonical);
}

bool verifyRecordSignature(const LicenseRecord& record, std::string_view appSecret) {
    auto expected = signRecord(record, appSecret);
    if (expected.isFailure()) {
        return false;
    }
    return constantTimeCompare(std::string_view(expected.value()),
                               std::string_view(record.signature));
}

Result<std::string> sealRecord(const LicenseRecord& record,
                               std::string_view appSecret,
                               std::string_view fingerprint) {
    AESKey key{};
    VARSYS_TRY_ASSIGN(key, deriveKey(appSecret, fingerprint, "", licenseKdfParameters()));
    
    AESCipher cipher(key);
    secureZero(key.data(), key.size());
    
    std::string plaintext;
    try {
        plaintext = record.toJson();
    } catch (const json::type_error& e) {
        VARSYS_LOG_ERROR_F("License record is not serializable: %s", e.what());
        return ErrorCode::JsonInvalid;
    }
    
    auto sealed = cipher.encrypt(asBytes(plaintext));
    secureZero(plaintext.data(), plaintext.size());
    if (sealed.isFailure()) {
        return sealed.error();
    }
    
    return toBase64(sealed.value());
}

Result<LicenseRecord> openRecord(std::string_view sealed,
                                 std::string_view appSecret,
                                 std::string_view fingerprint) {
    AESKey key{};
    VARSYS_TRY_ASSIGN(key, deriveKey(appSecret, fingerprint, "", licenseKdfParameters()));
    
    auto ciphertext = fromBase64(sealed);
    if (ciphertext.isFailure()) {
        secureZero(key.data(), key.size());
        VARSYS_LOG_WARNING("License file is not valid base64");
        return ErrorCode::LicenseTampered;
    }
    
    AESCipher cipher(key);
    secureZero(key.data(), key.size());
    
    auto plaintext = cipher.decrypt(ciphertext.value());
    if (plaintext.isFailure()) {
        VARSYS_LOG_WARNING("License file failed authenticated decryption");
        return ErrorCode::LicenseTampered;
    }
    
    auto& bytes = plaintext.value();
    auto record = LicenseRecord::fromJson(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    secureZero(bytes.data(), bytes.size());
    if (record.isFailure()) {
        VARSYS_LOG_WARNING_F("License payload rejected: %s",
                             std::string(getErrorName(record.error())).c_str());
        return ErrorCode::LicenseTampered;
    }
    return record;
}

} // namespace Varsys::License
