/**
 * @file Settings.cpp
 * @brief Runtime settings: configuration keys, environment and secrets
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/Config.hpp>
#include <Varsys/Core/Logger.hpp>

#include <cstdlib>
#include <filesystem>

namespace Varsys::Config {

namespace {

// Development-only fallbacks. A build shipped to customers must run with
// all three environment variables set.
constexpr const char* DEV_APP_SECRET = "varsys-dev-app-secret-not-for-production";
constexpr const char* DEV_VAULT_SECRET = "varsys-dev-vault-secret-not-for-production";
constexpr const char* DEV_INTEGRITY_KEY = "varsys-dev-integrity-key-not-for-production";

Result<std::string> getString(const ConfigMap& config, const char* key, const std::string& fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    VARSYS_LOG_ERROR_F("Config key '%s' must be a string", key);
    return ErrorCode::ConfigInvalid;
}

Result<int64_t> getBoundedInt(const ConfigMap& config, const char* key,
                              int64_t fallback, int64_t maximum) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (const auto* number = std::get_if<int64_t>(&it->second)) {
        if (*number > 0 && *number <= maximum) {
            return *number;
        }
    }
    VARSYS_LOG_ERROR_F("Config key '%s' must be an integer in [1, %lld]",
                       key, static_cast<long long>(maximum));
    return ErrorCode::ConfigInvalid;
}

} // namespace

EnvironmentLookup systemEnvironment() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

Settings Settings::defaults() {
    Settings settings;
    settings.appSecret = DEV_APP_SECRET;
    settings.vaultSecret = DEV_VAULT_SECRET;
    settings.integrityKey = DEV_INTEGRITY_KEY;
    settings.usingDevelopmentSecrets = true;
    return settings;
}

Result<Settings> Settings::fromConfigMap(const ConfigMap& config) {
    Settings settings = defaults();
    
    struct StringKey {
        const char* key;
        std::string Settings::* field;
    };
    static const StringKey stringKeys[] = {
        {"data_dir",        &Settings::dataDir},
        {"license_file",    &Settings::licenseFile},
        {"vault_file",      &Settings::vaultFile},
        {"checksum_file",   &Settings::checksumFile},
        {"access_log_file", &Settings::accessLogFile},
        {"log_file",        &Settings::logFile},
        {"authority_url",   &Settings::authorityUrl},
        {"vault_feature",   &Settings::vaultFeature},
    };
    
    for (const auto& entry : stringKeys) {
        auto value = getString(config, entry.key, settings.*entry.field);
        if (value.isFailure()) {
            return value.error();
        }
        settings.*entry.field = std::move(value.value());
    }
    
    std::string levelName;
    VARSYS_TRY_ASSIGN(levelName, getString(config, "log_level", "info"));
    auto level = Core::ParseLogLevel(levelName);
    if (!level) {
        VARSYS_LOG_ERROR_F("Unknown log_level '%s'", levelName.c_str());
        return ErrorCode::ConfigInvalid;
    }
    settings.logLevel = *level;
    
    int64_t timeoutMs = 0;
    VARSYS_TRY_ASSIGN(timeoutMs, getBoundedInt(config, "authority_timeout_ms",
                                               settings.authorityTimeout.count(),
                                               MAX_AUTHORITY_TIMEOUT_MS));
    settings.authorityTimeout = Milliseconds(timeoutMs);
    
    int64_t intervalDays = 0;
    VARSYS_TRY_ASSIGN(intervalDays, getBoundedInt(config, "online_check_interval_days",
                                                  settings.onlineCheckIntervalDays,
                                                  MAX_ONLINE_CHECK_INTERVAL_DAYS));
    settings.onlineCheckIntervalDays = intervalDays;
    
    int64_t backoffMinutes = 0;
    VARSYS_TRY_ASSIGN(backoffMinutes, getBoundedInt(config, "online_retry_backoff_minutes",
                                                    settings.onlineRetryBackoffMinutes,
                                                    MAX_ONLINE_RETRY_BACKOFF_MINUTES));
    settings.onlineRetryBackoffMinutes = backoffMinutes;
    
    if (settings.vaultFeature.empty() || settings.licenseFile.empty() ||
        settings.vaultFile.empty() || settings.checksumFile.empty() ||
        settings.accessLogFile.empty()) {
        VARSYS_LOG_ERROR("File names and vault_feature must not be empty");
        return ErrorCode::ConfigInvalid;
    }
    
    return settings;
}

void Settings::applyEnvironment(const EnvironmentLookup& lookup) {
    auto read = [&lookup](const char* name) -> std::string {
        const char* value = lookup ? lookup(name) : nullptr;
        return value != nullptr ? std::string(value) : std::string();
    };
    
    bool allProvided = true;
    auto applySecret = [&](const char* name, std::string& target, const char* fallback) {
        std::string value = read(name);
        if (!value.empty()) {
            target = std::move(value);
        } else {
            target = fallback;
            allProvided = false;
            VARSYS_LOG_WARNING_F("%s not set; using development default", name);
        }
    };
    
    applySecret(ENV_APP_SECRET, appSecret, DEV_APP_SECRET);
    applySecret(ENV_VAULT_SECRET, vaultSecret, DEV_VAULT_SECRET);
    applySecret(ENV_INTEGRITY_KEY, integrityKey, DEV_INTEGRITY_KEY);
    usingDevelopmentSecrets = !allProvided;
    
    std::string dir = read(ENV_DATA_DIR);
    if (!dir.empty()) {
        dataDir = dir;
    }
    
    std::string server = read(ENV_LICENSE_SERVER);
    if (!server.empty()) {
        authorityUrl = server;
    }
}

std::string Settings::resolve(const std::string& fileName) const {
    std::filesystem::path file(fileName);
    if (file.is_absolute() || dataDir.empty()) {
        return file.string();
    }
    return (std::filesystem::path(dataDir) / file).string();
}

} // namespace Varsys::Config
