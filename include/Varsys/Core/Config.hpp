/**
 * @file Config.hpp
 * @brief Configuration loading and runtime settings for Varsys
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * SecureConfigLoader reads a key = value file with protection against:
 * - Path traversal (realpath canonicalization, optional allowed directory)
 * - Symlink substitution (O_NOFOLLOW on the canonical path)
 * - Oversized files (size checked on the open descriptor)
 * - Tampering (optional detached HMAC-SHA256 signature)
 * 
 * Settings maps the loaded keys, plus environment overrides and secrets,
 * onto the values LicenseStore and SecretVault are constructed from.
 */

#pragma once

#ifndef VARSYS_CORE_CONFIG_HPP
#define VARSYS_CORE_CONFIG_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <Varsys/Core/Logger.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace Varsys::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    ByteBuffer
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Options for SecureConfigLoader
 */
struct ConfigLoaderOptions {
    size_t max_file_size = 1024 * 1024;  // 1MB default
    bool verify_signature = false;       ///< Require "<path>.sig"
    ByteBuffer signature_key;            ///< HMAC-SHA256 key for the .sig file
    std::string allowed_directory;       ///< Restrict loads to this directory
};

/**
 * @brief Secure configuration loader
 */
class SecureConfigLoader {
public:
    using Options = ConfigLoaderOptions;
    
    explicit SecureConfigLoader(const Options& options = {});
    ~SecureConfigLoader();
    
    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration, or InvalidPath / AccessDenied /
     *         FileNotFound / FileTooLarge / IOError / SignatureInvalid
     */
    Result<ConfigMap> load(const std::string& path);
    
    /**
     * @brief Parse configuration from memory
     * 
     * Values are typed: true/false become bool, decimal integers int64_t,
     * decimal numbers double, everything else a string (surrounding double
     * quotes stripped). '#' and ';' start comment lines.
     * 
     * @param data Configuration text
     * @param signature Hex HMAC-SHA256 of data (checked when verify_signature)
     * @return Parsed configuration or error
     */
    Result<ConfigMap> loadFromMemory(
        ByteSpan data,
        ByteSpan signature = {});
    
private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Runtime Settings
// ============================================================================

/// Environment variable holding the license encryption/signing secret
constexpr const char* ENV_APP_SECRET = "VARSYS_APP_SECRET";

/// Environment variable holding the vault master secret
constexpr const char* ENV_VAULT_SECRET = "VARSYS_FIREBASE_SECRET";

/// Environment variable holding the vault integrity key
constexpr const char* ENV_INTEGRITY_KEY = "VARSYS_INTEGRITY_KEY";

/// Environment override for Settings::dataDir
constexpr const char* ENV_DATA_DIR = "VARSYS_DATA_DIR";

/// Environment override for Settings::authorityUrl
constexpr const char* ENV_LICENSE_SERVER = "VARSYS_LICENSE_SERVER";

/// Upper bounds accepted for the numeric configuration keys
constexpr int64_t MAX_AUTHORITY_TIMEOUT_MS = 300000;
constexpr int64_t MAX_ONLINE_CHECK_INTERVAL_DAYS = 3650;
constexpr int64_t MAX_ONLINE_RETRY_BACKOFF_MINUTES = 10080;

/**
 * @brief Environment lookup; returns nullptr for an unset variable
 */
using EnvironmentLookup = std::function<const char*(const char*)>;

/**
 * @brief Lookup backed by ::getenv
 */
EnvironmentLookup systemEnvironment();

/**
 * @brief Everything the license vault needs to start
 * 
 * Secrets never come from the configuration file. They are read from the
 * environment, and when a variable is absent a built-in development value
 * is used and flagged through usingDevelopmentSecrets.
 */
struct Settings {
    std::string dataDir = ".";
    std::string licenseFile = "license.dat";
    std::string vaultFile = "firebase_vault.dat";
    std::string checksumFile = "firebase_checksum.dat";
    std::string accessLogFile = "firebase_access.log";
    
    std::string logFile;                        ///< Empty disables the file sink
    Core::LogLevel logLevel = Core::LogLevel::Info;
    
    std::string authorityUrl;                   ///< Empty selects the offline authority
    Milliseconds authorityTimeout{5000};
    int64_t onlineCheckIntervalDays = 7;
    int64_t onlineRetryBackoffMinutes = 60;
    
    std::string vaultFeature = "firebase_sync";
    
    std::string appSecret;
    std::string vaultSecret;
    std::string integrityKey;
    bool usingDevelopmentSecrets = true;
    
    /**
     * @brief Defaults with development secrets filled in
     */
    static Settings defaults();
    
    /**
     * @brief Overlay loaded configuration onto the defaults
     * 
     * Recognized keys: data_dir, license_file, vault_file, checksum_file,
     * access_log_file, log_file, log_level, authority_url,
     * authority_timeout_ms, online_check_interval_days,
     * online_retry_backoff_minutes, vault_feature. Unknown keys are ignored.
     * 
     * @return Settings, or ConfigInvalid for a value of the wrong type or range
     */
    static Result<Settings> fromConfigMap(const ConfigMap& config);
    
    /**
     * @brief Apply environment secrets and overrides
     * @param lookup Environment source (systemEnvironment() in production)
     */
    void applyEnvironment(const EnvironmentLookup& lookup);
    
    /**
     * @brief Resolve a file name against dataDir (absolute names pass through)
     */
    std::string resolve(const std::string& fileName) const;
    
    std::string licensePath() const { return resolve(licenseFile); }
    std::string vaultPath() const { return resolve(vaultFile); }
    std::string checksumPath() const { return resolve(checksumFile); }
    std::string accessLogPath() const { return resolve(accessLogFile); }
};

} // namespace Varsys::Config

#endif // VARSYS_CORE_CONFIG_HPP
