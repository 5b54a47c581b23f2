/**
 * @file SecretVault.hpp
 * @brief License- and machine-bound encrypted configuration store
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_VAULT_SECRET_VAULT_HPP
#define VARSYS_VAULT_SECRET_VAULT_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <Varsys/Core/Config.hpp>
#include <Varsys/Vault/VaultRecord.hpp>

#include <memory>
#include <string>

namespace Varsys::License {
class AccessGate;
}

namespace Varsys::Audit {
class AccessLog;
}

namespace Varsys::Vault {

/**
 * @brief Stores one protected configuration object for this machine
 * 
 * Every store() and retrieve() first obtains an AccessToken for
 * Settings::vaultFeature from the AccessGate. A retrieve() succeeds only
 * when the checksum, AES-GCM tag, integrity hash, machine binding and
 * payload signature all verify; each successful retrieve increments the
 * stored access counter and rewrites the vault.
 * 
 * All operations hold an exclusive per-vault mutex.
 * 
 * @example
 * ```cpp
 * SecretVault vault(settings, fingerprint, gate, accessLog);
 * vault.store({{"apiKey", "k1"}, {"projectId", "p1"}});
 * auto config = vault.retrieve();
 * ```
 */
class SecretVault {
public:
    SecretVault(const Config::Settings& settings,
                std::string machineFingerprint,
                License::AccessGate& gate,
                Audit::AccessLog& accessLog,
                TimeSource clock = unixNow);
    
    ~SecretVault();
    
    SecretVault(const SecretVault&) = delete;
    SecretVault& operator=(const SecretVault&) = delete;
    
    /**
     * @brief Encrypt and persist a configuration object
     * @param config JSON object to protect
     * @return Success, LicenseRequired, InvalidArgument, or a write error
     */
    Result<void> store(const ProtectedConfig& config);
    
    /**
     * @brief Authenticate, decrypt and return the configuration
     * @return Config, or LicenseRequired, VaultMissing, OuterTamperDetected,
     *         DecryptionFailed, InnerTamperDetected, MachineMismatch,
     *         SignatureInvalid, FileWriteError
     */
    Result<ProtectedConfig> retrieve();
    
    /**
     * @brief Overwrite both vault files with random data and delete them
     * @return Success (also when neither file exists) or a write error
     */
    Result<void> destroy();
    
    /**
     * @brief The gate allows the vault feature and retrieve() succeeds
     */
    bool isAccessible() noexcept;
    
    /**
     * @brief Access counter observed by the last store() or retrieve()
     * @return Count, or InvalidState before either has succeeded
     */
    Result<uint64_t> accessCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Varsys::Vault

#endif // VARSYS_VAULT_SECRET_VAULT_HPP
