/**
 * @file SecretVault.cpp
 * @brief Secret vault implementation
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Vault/SecretVault.hpp>
#include <Varsys/Audit/AccessLog.hpp>
#include <Varsys/License/AccessGate.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/FileStore.hpp>
#include <Varsys/Core/Logger.hpp>

#include <mutex>
#include <optional>

namespace Varsys::Vault {

using License::AccessToken;

namespace {

constexpr const char* ACTION_STORE = "store_config";
constexpr const char* ACTION_RETRIEVE = "retrieve_config";
constexpr const char* ACTION_DESTROY = "destroy_vault";

const char* describeRetrieveFailure(ErrorCode error) {
    switch (error) {
        case ErrorCode::VaultMissing:        return "Vault files missing";
        case ErrorCode::OuterTamperDetected: return "Vault checksum mismatch";
        case ErrorCode::DecryptionFailed:    return "Vault decryption failed";
        case ErrorCode::InnerTamperDetected: return "Integrity verification failed";
        case ErrorCode::MachineMismatch:     return "Machine fingerprint mismatch";
        case ErrorCode::SignatureInvalid:    return "Payload signature invalid";
        case ErrorCode::FileWriteError:      return "Access counter could not be recorded";
        default:                             return "Vault read failed";
    }
}

/**
 * @brief Every key and string value in the tree is valid UTF-8
 */
bool hasValidText(const ProtectedConfig& node) {
    if (node.is_string()) {
        return Crypto::isValidUtf8(node.get_ref<const std::string&>());
    }
    if (node.is_object()) {
        for (const auto& item : node.items()) {
            if (!Crypto::isValidUtf8(item.key()) || !hasValidText(item.value())) {
                return false;
            }
        }
        return true;
    }
    if (node.is_array()) {
        for (const auto& element : node) {
            if (!hasValidText(element)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

// ============================================================================
// SecretVault::Impl
// ============================================================================

class SecretVault::Impl {
public:
    Impl(const Config::Settings& settings,
         std::string machineFingerprint,
         License::AccessGate& gate,
         Audit::AccessLog& accessLog,
         TimeSource clock)
        : m_settings(settings)
        , m_codec(VaultSecrets{settings.vaultSecret, settings.appSecret, settings.integrityKey},
                  std::move(machineFingerprint))
        , m_gate(gate)
        , m_accessLog(accessLog)
        , m_clock(std::move(clock))
    {
    }
    
    Result<void> store(const ProtectedConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto token = m_gate.authorize(m_settings.vaultFeature);
        if (token.isFailure()) {
            m_accessLog.record(ACTION_STORE, false, "Invalid license");
            return ErrorCode::LicenseRequired;
        }
        
        if (!config.is_object()) {
            m_accessLog.record(ACTION_STORE, false, "Configuration must be an object");
            return ErrorCode::InvalidArgument;
        }
        if (!hasValidText(config)) {
            m_accessLog.record(ACTION_STORE, false, "Configuration contains invalid UTF-8");
            return ErrorCode::InvalidArgument;
        }
        
        VaultPayload payload;
        payload.protected_config = config;
        payload.bound_machine_fingerprint = m_codec.fingerprint();
        payload.creation_time = m_clock();
        payload.access_count = 0;
        
        auto written = sealAndWrite(token.value(), payload);
        if (written.isFailure()) {
            m_accessLog.record(ACTION_STORE, false, std::string(getErrorMessage(written.error())));
            return written;
        }
        
        m_lastAccessCount = 0;
        m_accessLog.record(ACTION_STORE, true, "Configuration stored securely");
        VARSYS_LOG_INFO("Protected configuration stored");
        return {};
    }
    
    Result<ProtectedConfig> retrieve() {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto token = m_gate.authorize(m_settings.vaultFeature);
        if (token.isFailure()) {
            m_accessLog.record(ACTION_RETRIEVE, false, "Invalid license");
            return ErrorCode::LicenseRequired;
        }
        
        auto payload = openVerified(token.value());
        if (payload.isFailure()) {
            m_accessLog.record(ACTION_RETRIEVE, false, describeRetrieveFailure(payload.error()));
            if (isTamperError(payload.error()) || payload.error() == ErrorCode::MachineMismatch) {
                VARSYS_LOG_WARNING_F("Vault rejected: %s",
                                     std::string(getErrorName(payload.error())).c_str());
            }
            return payload.error();
        }
        
        VaultPayload& current = payload.value();
        current.access_count += 1;
        
        auto written = sealAndWrite(token.value(), current);
        if (written.isFailure()) {
            m_accessLog.record(ACTION_RETRIEVE, false, describeRetrieveFailure(ErrorCode::FileWriteError));
            VARSYS_LOG_ERROR_F("Vault reseal failed: %s",
                               std::string(getErrorMessage(written.error())).c_str());
            return ErrorCode::FileWriteError;
        }
        
        m_lastAccessCount = current.access_count;
        m_accessLog.record(ACTION_RETRIEVE, true, "Configuration retrieved");
        return std::move(current.protected_config);
    }
    
    Result<void> destroy() {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        const std::string paths[] = {m_settings.vaultPath(), m_settings.checksumPath()};
        bool found = false;
        
        for (const auto& path : paths) {
            auto erased = IO::secureErase(path);
            if (erased.isSuccess()) {
                found = true;
                continue;
            }
            if (erased.error() == ErrorCode::FileNotFound) {
                continue;
            }
            m_accessLog.record(ACTION_DESTROY, false, std::string(getErrorMessage(erased.error())));
            VARSYS_LOG_ERROR_F("Secure erase of %s failed", path.c_str());
            return erased;
        }
        
        if (!found) {
            m_lastAccessCount.reset();
            m_accessLog.record(ACTION_DESTROY, true, "Nothing to destroy");
            VARSYS_LOG_DEBUG("No vault files to destroy");
            return {};
        }
        
        m_lastAccessCount.reset();
        m_accessLog.record(ACTION_DESTROY, true, "Vault destroyed");
        VARSYS_LOG_INFO("Vault destroyed");
        return {};
    }
    
    Result<uint64_t> accessCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_lastAccessCount) {
            return ErrorCode::InvalidState;
        }
        return *m_lastAccessCount;
    }

private:
    /**
     * @brief Read both files and run every verification layer
     */
    Result<VaultPayload> openVerified(const AccessToken& token) {
        if (!IO::fileExists(m_settings.vaultPath()) || !IO::fileExists(m_settings.checksumPath())) {
            return ErrorCode::VaultMissing;
        }
        
        std::string vaultFile;
        VARSYS_TRY_ASSIGN(vaultFile, IO::readTextFile(m_settings.vaultPath()));
        std::string checksumFile;
        VARSYS_TRY_ASSIGN(checksumFile, IO::readTextFile(m_settings.checksumPath()));
        
        auto payload = m_codec.open(vaultFile, checksumFile);
        if (payload.isFailure()) {
            return payload.error();
        }
        
        if (payload.value().bound_machine_fingerprint != m_codec.fingerprint()) {
            return ErrorCode::MachineMismatch;
        }
        
        if (!m_codec.verifyPayloadSignature(payload.value(), token.license().license_key)) {
            return ErrorCode::SignatureInvalid;
        }
        
        return payload;
    }
    
    /**
     * @brief Sign for the authorized license, seal and replace both files
     * 
     * The vault file is replaced before the checksum file.
     */
    Result<void> sealAndWrite(const AccessToken& token, VaultPayload& payload) {
        std::string signature;
        VARSYS_TRY_ASSIGN(signature, m_codec.signPayload(payload.protected_config,
                                                         token.license().license_key));
        payload.payload_signature = std::move(signature);
        
        SealedVault sealed;
        VARSYS_TRY_ASSIGN(sealed, m_codec.seal(payload));
        
        VARSYS_TRY(IO::ensureDirectory(m_settings.dataDir));
        VARSYS_TRY(IO::writeFileAtomic(m_settings.vaultPath(), asBytes(sealed.vaultFile)));
        return IO::writeFileAtomic(m_settings.checksumPath(), asBytes(sealed.checksumFile));
    }
    
    const Config::Settings& m_settings;
    VaultCodec m_codec;
    License::AccessGate& m_gate;
    Audit::AccessLog& m_accessLog;
    TimeSource m_clock;
    
    mutable std::mutex m_mutex;
    std::optional<uint64_t> m_lastAccessCount;
};

// ============================================================================
// SecretVault public interface
// ============================================================================

SecretVault::SecretVault(const Config::Settings& settings,
                         std::string machineFingerprint,
                         License::AccessGate& gate,
                         Audit::AccessLog& accessLog,
                         TimeSource clock)
    : m_impl(std::make_unique<Impl>(settings, std::move(machineFingerprint), gate,
                                    accessLog, std::move(clock)))
{
}

SecretVault::~SecretVault() = default;

Result<void> SecretVault::store(const ProtectedConfig& config) {
    return m_impl->store(config);
}

Result<ProtectedConfig> SecretVault::retrieve() {
    return m_impl->retrieve();
}

Result<void> SecretVault::destroy() {
    return m_impl->destroy();
}

bool SecretVault::isAccessible() noexcept {
    try {
        return m_impl->retrieve().isSuccess();
    } catch (const std::exception& e) {
        VARSYS_LOG_ERROR_F("Vault accessibility check failed: %s", e.what());
        return false;
    }
}

Result<uint64_t> SecretVault::accessCount() const {
    return m_impl->accessCount();
}

} // namespace Varsys::Vault
