/**
 * @file VaultRecord.hpp
 * @brief Vault file format and the codec that seals and opens it
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * A vault is persisted as two files:
 * 
 *   vault file     {"encrypted_payload":<base64>,"integrity_hash":<hex>,
 *                   "protection_level":"maximum","vault_version":"2.0"}
 *   checksum file  SHA-256 hex of the exact vault file bytes
 * 
 * encrypted_payload is AES-256-GCM over the serialized VaultPayload.
 * integrity_hash is SHA-512(payload JSON || integrity key || fingerprint).
 */

#pragma once

#ifndef VARSYS_VAULT_VAULT_RECORD_HPP
#define VARSYS_VAULT_VAULT_RECORD_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace Varsys::Vault {

/// Structured configuration protected by the vault (always a JSON object)
using ProtectedConfig = nlohmann::json;

/// Current vault file version
constexpr const char* VAULT_VERSION = "2.0";

/// Protection level recorded in the vault file
constexpr const char* PROTECTION_LEVEL = "maximum";

/**
 * @brief Outer vault file contents
 */
struct VaultRecord {
    std::string encrypted_payload;   ///< base64
    std::string integrity_hash;      ///< SHA-512 hex
    std::string vault_version = VAULT_VERSION;
    std::string protection_level = PROTECTION_LEVEL;
    
    std::string toJson() const;
    
    static Result<VaultRecord> fromJson(std::string_view text);
};

/**
 * @brief Decrypted vault contents (memory only)
 */
struct VaultPayload {
    ProtectedConfig protected_config = ProtectedConfig::object();
    std::string bound_machine_fingerprint;
    UnixTime creation_time = 0;
    std::string payload_signature;
    uint64_t access_count = 0;
    
    std::string toJson() const;
    
    static Result<VaultPayload> fromJson(std::string_view text);
};

/**
 * @brief Secrets feeding the vault key, payload signature and integrity hash
 */
struct VaultSecrets {
    std::string vaultSecret;
    std::string appSecret;
    std::string integrityKey;
};

/**
 * @brief Both files of a sealed vault
 */
struct SealedVault {
    std::string vaultFile;
    std::string checksumFile;
};

/**
 * @brief Seals and opens vaults for one machine
 * 
 * The vault key is PBKDF2 over vault secret || fingerprint || app secret ||
 * "firebase_store" with the vault parameter set.
 */
class VaultCodec {
public:
    VaultCodec(VaultSecrets secrets, std::string fingerprint);
    
    /**
     * @brief Encrypt a payload into vault and checksum file contents
     */
    Result<SealedVault> seal(const VaultPayload& payload) const;
    
    /**
     * @brief Authenticate and decrypt a vault
     * 
     * Checks run in this order:
     * - checksum over the vault bytes (one trailing newline tolerated) → OuterTamperDetected
     * - vault JSON structure → OuterTamperDetected
     * - AES-GCM decryption → DecryptionFailed
     * - integrity hash → InnerTamperDetected
     * - payload structure → InnerTamperDetected
     * 
     * Machine binding and the payload signature are left to the caller.
     */
    Result<VaultPayload> open(std::string_view vaultFile, std::string_view checksumFile) const;
    
    /**
     * @brief HMAC-SHA256 over {license_key, machine_fingerprint, protected_config}
     */
    Result<std::string> signPayload(const ProtectedConfig& config, std::string_view licenseKey) const;
    
    bool verifyPayloadSignature(const VaultPayload& payload, std::string_view licenseKey) const;
    
    /**
     * @brief SHA-512 hex of plaintext || integrity key || fingerprint
     */
    Result<std::string> integrityHash(std::string_view plaintext) const;
    
    /**
     * @brief SHA-256 hex of the vault file bytes
     */
    static Result<std::string> checksum(std::string_view vaultFile);
    
    const std::string& fingerprint() const noexcept { return m_fingerprint; }

private:
    Result<AESKey> vaultKey() const;
    
    VaultSecrets m_secrets;
    std::string m_fingerprint;
};

} // namespace Varsys::Vault

#endif // VARSYS_VAULT_VAULT_RECORD_HPP
