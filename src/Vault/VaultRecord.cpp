/**
 * @file VaultRecord.cpp
 * @brief Vault serialization and sealing
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Vault/VaultRecord.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/KeyDerivation.hpp>
#include <Varsys/Core/Logger.hpp>

namespace Varsys::Vault {

using json = nlohmann::json;
using namespace Varsys::Crypto;

// ============================================================================
// VaultRecord
// ============================================================================

std::string VaultRecord::toJson() const {
    json j = {
        {"encrypted_payload", encrypted_payload},
        {"integrity_hash", integrity_hash},
        {"vault_version", vault_version},
        {"protection_level", protection_level}
    };
    return j.dump();
}

Result<VaultRecord> VaultRecord::fromJson(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return ErrorCode::JsonParseFailed;
    }
    if (!j.is_object()) {
        return ErrorCode::JsonInvalid;
    }
    
    try {
        VaultRecord record;
        record.encrypted_payload = j.at("encrypted_payload").get<std::string>();
        record.integrity_hash = j.at("integrity_hash").get<std::string>();
        record.vault_version = j.at("vault_version").get<std::string>();
        record.protection_level = j.value("protection_level", std::string(PROTECTION_LEVEL));
        return record;
    } catch (const json::out_of_range&) {
        return ErrorCode::MissingField;
    } catch (const json::exception&) {
        return ErrorCode::InvalidFieldType;
    }
}

// ============================================================================
// VaultPayload
// ============================================================================

std::string VaultPayload::toJson() const {
    json j = {
        {"protected_config", protected_config},
        {"bound_machine_fingerprint", bound_machine_fingerprint},
        {"creation_time", creation_time},
        {"payload_signature", payload_signature},
        {"access_count", access_count}
    };
    return j.dump();
}

Result<VaultPayload> VaultPayload::fromJson(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return ErrorCode::JsonParseFailed;
    }
    if (!j.is_object()) {
        return ErrorCode::JsonInvalid;
    }
    
    try {
        VaultPayload payload;
        payload.protected_config = j.at("protected_config");
        if (!payload.protected_config.is_object()) {
            return ErrorCode::InvalidFieldType;
        }
        payload.bound_machine_fingerprint = j.at("bound_machine_fingerprint").get<std::string>();
        payload.creation_time = j.at("creation_time").get<UnixTime>();
        payload.payload_signature = j.at("payload_signature").get<std::string>();
        payload.access_count = j.value("access_count", uint64_t{0});
        return payload;
    } catch (const json::out_of_range&) {
        return ErrorCode::MissingField;
    } catch (const json::exception&) {
        return ErrorCode::InvalidFieldType;
    }
}

// ============================================================================
// VaultCodec
// ============================================================================

VaultCodec::VaultCodec(VaultSecrets secrets, std::string fingerprint)
    : m_secrets(std::move(secrets))
    , m_fingerprint(std::move(fingerprint))
{
}

Result<AESKey> VaultCodec::vaultKey() const {
    std::string context = m_secrets.appSecret + VAULT_KEY_CONTEXT;
    auto key = deriveKey(m_secrets.vaultSecret, m_fingerprint, context, vaultKdfParameters());
    secureZero(context.data(), context.size());
    return key;
}

Result<std::string> VaultCodec::integrityHash(std::string_view plaintext) const {
    HashEngine engine(HashAlgorithm::SHA512);
    VARSYS_TRY(engine.init());
    VARSYS_TRY(engine.update(asBytes(plaintext)));
    VARSYS_TRY(engine.update(asBytes(m_secrets.integrityKey)));
    VARSYS_TRY(engine.update(asBytes(m_fingerprint)));
    
    ByteBuffer digest;
    VARSYS_TRY_ASSIGN(digest, engine.finalize());
    return toHex(digest);
}

Result<std::string> VaultCodec::checksum(std::string_view vaultFile) {
    auto digest = HashEngine::sha256(asBytes(vaultFile));
    if (digest.isFailure()) {
        return digest.error();
    }
    return toHex(digest.value());
}

Result<std::string> VaultCodec::signPayload(const ProtectedConfig& config,
                                            std::string_view licenseKey) const {
    json material = {
        {"protected_config", config},
        {"machine_fingerprint", m_fingerprint},
        {"license_key", std::string(licenseKey)}
    };
    std::string canonical;
    try {
        canonical = material.dump();
    } catch (const json::type_error& e) {
        VARSYS_LOG_ERROR_F("Protected configuration is not serializable: %s", e.what());
        return ErrorCode::JsonInvalid;
    }
    return HMAC::sha256Hex(m_secrets.vaultSecret, canonical);
}

bool VaultCodec::verifyPayloadSignature(const VaultPayload& payload,
                                        std::string_view licenseKey) const {
    auto expected = signPayload(payload.protected_config, licenseKey);
    if (expected.isFailure()) {
        return false;
    }
    return constantTimeCompare(std::string_view(expected.value()),
                               std::string_view(payload.payload_signature));
}

Result<SealedVault> VaultCodec::seal(const VaultPayload& payload) const {
    std::string plaintext;
    try {
        plaintext = payload.toJson();
    } catch (const json::type_error& e) {
        VARSYS_LOG_ERROR_F("Vault payload is not serializable: %s", e.what());
        return ErrorCode::JsonInvalid;
    }
    
    std::string hash;
    VARSYS_TRY_ASSIGN(hash, integrityHash(plaintext));
    
    VaultRecord record;
    record.integrity_hash = std::move(hash);
    
    AESKey key{};
    VARSYS_TRY_ASSIGN(key, vaultKey());
    AESCipher cipher(key);
    secureZero(key.data(), key.size());
    
    auto ciphertext = cipher.encrypt(asBytes(plaintext));
    secureZero(plaintext.data(), plaintext.size());
    if (ciphertext.isFailure()) {
        return ciphertext.error();
    }
    record.encrypted_payload = toBase64(ciphertext.value());
    
    SealedVault sealed;
    sealed.vaultFile = record.toJson();
    
    std::string digest;
    VARSYS_TRY_ASSIGN(digest, checksum(sealed.vaultFile));
    sealed.checksumFile = std::move(digest);
    return sealed;
}

Result<VaultPayload> VaultCodec::open(std::string_view vaultFile,
                                      std::string_view checksumFile) const {
    if (!checksumFile.empty() && checksumFile.back() == '\n') {
        checksumFile.remove_suffix(1);
    }
    
    std::string actual;
    VARSYS_TRY_ASSIGN(actual, checksum(vaultFile));
    if (!constantTimeCompare(std::string_view(actual), checksumFile)) {
        VARSYS_LOG_WARNING("Vault checksum mismatch");
        return ErrorCode::OuterTamperDetected;
    }
    
    auto record = VaultRecord::fromJson(vaultFile);
    if (record.isFailure()) {
        VARSYS_LOG_WARNING("Vault file structure invalid");
        return ErrorCode::OuterTamperDetected;
    }
    
    auto ciphertext = fromBase64(record.value().encrypted_payload);
    if (ciphertext.isFailure()) {
        VARSYS_LOG_WARNING("Vault payload is not valid base64");
        return ErrorCode::OuterTamperDetected;
    }
    
    AESKey key{};
    VARSYS_TRY_ASSIGN(key, vaultKey());
    AESCipher cipher(key);
    secureZero(key.data(), key.size());
    
    auto decrypted = cipher.decrypt(ciphertext.value());
    if (decrypted.isFailure()) {
        VARSYS_LOG_WARNING("Vault payload failed authenticated decryption");
        return ErrorCode::DecryptionFailed;
    }
    
    ByteBuffer& bytes = decrypted.value();
    std::string plaintext(bytes.begin(), bytes.end());
    secureZero(bytes.data(), bytes.size());
    
    auto expected = integrityHash(plaintext);
    if (expected.isFailure() ||
        !constantTimeCompare(std::string_view(expected.value()),
                             std::string_view(record.value().integrity_hash))) {
        secureZero(plaintext.data(), plaintext.size());
        VARSYS_LOG_WARNING("Vault integrity hash mismatch");
        return ErrorCode::InnerTamperDetected;
    }
    
    auto payload = VaultPayload::fromJson(plaintext);
    secureZero(plaintext.data(), plaintext.size());
    if (payload.isFailure()) {
        VARSYS_LOG_WARNING("Vault payload structure invalid");
        return ErrorCode::InnerTamperDetected;
    }
    return payload;
}

} // namespace Varsys::Vault
