/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the configuration loader and runtime settings
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Tests configuration loading to ensure:
 * - Path traversal blocked
 * - Size limits enforced
 * - Optional HMAC signature verification
 * - Settings mapping, validation and environment overrides
 */

#include <Varsys/Core/Config.hpp>
#include <Varsys/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <map>

using namespace Varsys;
using namespace Varsys::Config;
using namespace Varsys::Crypto;
using namespace Varsys::Testing;

namespace fs = std::filesystem;

namespace {

const std::string SIGNING_KEY = "config-signing-key-for-tests";

ByteBuffer signingKey() {
    return ByteBuffer(SIGNING_KEY.begin(), SIGNING_KEY.end());
}

std::string signText(const std::string& text) {
    auto mac = HMAC::sha256Hex(SIGNING_KEY, text);
    EXPECT_TRUE(mac.isSuccess());
    return mac.isSuccess() ? mac.value() : std::string();
}

EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> vars) {
    auto shared = std::make_shared<std::map<std::string, std::string>>(std::move(vars));
    return [shared](const char* name) -> const char* {
        auto it = shared->find(name);
        return it == shared->end() ? nullptr : it->second.c_str();
    };
}

} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::string createTestConfig(const std::string& name, const std::string& content) {
        std::string path = temp.file(name);
        writeFileText(path, content);
        return path;
    }
    
    TempDirectory temp;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigLoaderTest, BasicLoad_InfersValueTypes) {
    std::string path = createTestConfig("varsys.conf",
        "# Test configuration\n"
        "data_dir = /var/lib/varsys\n"
        "quoted = \"  spaced value \"\n"
        "timeout = 42\n"
        "ratio = 0.5\n"
        "enabled = true\n");
    
    SecureConfigLoader loader;
    auto result = loader.load(path);
    ASSERT_RESULT_OK(result);
    
    ConfigMap config = result.value();
    EXPECT_EQ(config.size(), 5u);
    EXPECT_EQ(std::get<std::string>(config["data_dir"]), "/var/lib/varsys");
    EXPECT_EQ(std::get<std::string>(config["quoted"]), "  spaced value ");
    EXPECT_EQ(std::get<int64_t>(config["timeout"]), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(config["ratio"]), 0.5);
    EXPECT_TRUE(std::get<bool>(config["enabled"]));
}

TEST_F(ConfigLoaderTest, MissingFile) {
    SecureConfigLoader loader;
    EXPECT_ERROR(loader.load(temp.file("absent.conf")), ErrorCode::FileNotFound);
}

TEST_F(ConfigLoaderTest, PathTraversalBlocked) {
    fs::create_directory(fs::path(temp.path()) / "allowed");
    createTestConfig("outside.conf", "key = value\n");
    
    SecureConfigLoader::Options options;
    options.allowed_directory = temp.file("allowed");
    SecureConfigLoader loader(options);
    
    std::string traversal = temp.file("allowed") + "/../outside.conf";
    EXPECT_ERROR(loader.load(traversal), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, DirectoryPrefixIsNotEnough) {
    fs::create_directory(fs::path(temp.path()) / "conf");
    fs::create_directory(fs::path(temp.path()) / "conf-other");
    std::string path = temp.file("conf-other/varsys.conf");
    writeFileText(path, "key = value\n");
    
    SecureConfigLoader::Options options;
    options.allowed_directory = temp.file("conf");
    SecureConfigLoader loader(options);
    
    EXPECT_ERROR(loader.load(path), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, SizeLimit) {
    SecureConfigLoader::Options options;
    options.max_file_size = 1024;
    SecureConfigLoader loader(options);
    
    std::string path = createTestConfig("large.conf", std::string(2048, '#'));
    EXPECT_ERROR(loader.load(path), ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, SymlinkToConfigResolvesToTarget) {
    std::string target = createTestConfig("real.conf", "key = value\n");
    std::string link = temp.file("link.conf");
    fs::create_symlink(target, link);
    
    SecureConfigLoader loader;
    auto result = loader.load(link);
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(std::get<std::string>(result.value()["key"]), "value");
}

// ============================================================================
// Signatures
// ============================================================================

TEST_F(ConfigLoaderTest, SignatureVerification) {
    const std::string content = "vault_feature = firebase_sync\n";
    std::string path = createTestConfig("signed.conf", content);
    writeFileText(path + ".sig", signText(content) + "\n");
    
    SecureConfigLoader::Options options;
    options.verify_signature = true;
    options.signature_key = signingKey();
    SecureConfigLoader loader(options);
    
    auto result = loader.load(path);
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(std::get<std::string>(result.value()["vault_feature"]), "firebase_sync");
}

TEST_F(ConfigLoaderTest, InvalidSignature) {
    std::string path = createTestConfig("signed.conf", "vault_feature = other\n");
    writeFileText(path + ".sig", signText("vault_feature = firebase_sync\n"));
    
    SecureConfigLoader::Options options;
    options.verify_signature = true;
    options.signature_key = signingKey();
    SecureConfigLoader loader(options);
    
    EXPECT_ERROR(loader.load(path), ErrorCode::SignatureInvalid);
}

TEST_F(ConfigLoaderTest, MissingSignatureFile) {
    std::string path = createTestConfig("unsigned.conf", "key = value\n");
    
    SecureConfigLoader::Options options;
    options.verify_signature = true;
    options.signature_key = signingKey();
    SecureConfigLoader loader(options);
    
    EXPECT_ERROR(loader.load(path), ErrorCode::SignatureInvalid);
}

TEST_F(ConfigLoaderTest, SignatureRequiresKey) {
    SecureConfigLoader::Options options;
    options.verify_signature = true;
    SecureConfigLoader loader(options);
    
    EXPECT_ERROR(loader.loadFromMemory(asBytes("key = value\n"), asBytes("00")),
                 ErrorCode::InvalidKey);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, EmptyConfiguration) {
    SecureConfigLoader loader;
    auto result = loader.loadFromMemory(asBytes(""));
    ASSERT_RESULT_OK(result);
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ConfigLoaderTest, CommentsAndWhitespace) {
    SecureConfigLoader loader;
    auto result = loader.loadFromMemory(asBytes(
        "# comment\n"
        "; another comment\n"
        "\n"
        "   key1   =   value1   \r\n"
        "\tkey2=value2\n"));
    ASSERT_RESULT_OK(result);
    
    ConfigMap config = result.value();
    EXPECT_EQ(config.size(), 2u);
    EXPECT_EQ(std::get<std::string>(config["key1"]), "value1");
    EXPECT_EQ(std::get<std::string>(config["key2"]), "value2");
}

TEST_F(ConfigLoaderTest, LineWithoutSeparator_Rejected) {
    SecureConfigLoader loader;
    EXPECT_ERROR(loader.loadFromMemory(asBytes("key = value\njust-a-word\n")),
                 ErrorCode::ConfigParseFailed);
    EXPECT_ERROR(loader.loadFromMemory(asBytes(" = value\n")),
                 ErrorCode::ConfigParseFailed);
}

// ============================================================================
// Settings
// ============================================================================

TEST(Settings, DefaultsUseDevelopmentSecrets) {
    Settings settings = Settings::defaults();
    
    EXPECT_TRUE(settings.usingDevelopmentSecrets);
    EXPECT_FALSE(settings.appSecret.empty());
    EXPECT_FALSE(settings.vaultSecret.empty());
    EXPECT_FALSE(settings.integrityKey.empty());
    EXPECT_EQ(settings.licenseFile, "license.dat");
    EXPECT_EQ(settings.vaultFile, "firebase_vault.dat");
    EXPECT_EQ(settings.checksumFile, "firebase_checksum.dat");
    EXPECT_EQ(settings.accessLogFile, "firebase_access.log");
    EXPECT_EQ(settings.vaultFeature, "firebase_sync");
    EXPECT_EQ(settings.onlineCheckIntervalDays, 7);
}

TEST(Settings, FromConfigMap_OverlaysKnownKeys) {
    SecureConfigLoader loader;
    auto config = loader.loadFromMemory(asBytes(
        "data_dir = /srv/varsys\n"
        "license_file = lic.dat\n"
        "log_level = debug\n"
        "authority_url = https://licensing.example.com\n"
        "authority_timeout_ms = 2500\n"
        "online_check_interval_days = 3\n"
        "unknown_key = ignored\n"));
    ASSERT_RESULT_OK(config);
    
    auto settings = Settings::fromConfigMap(config.value());
    ASSERT_RESULT_OK(settings);
    
    const Settings& s = settings.value();
    EXPECT_EQ(s.dataDir, "/srv/varsys");
    EXPECT_EQ(s.licenseFile, "lic.dat");
    EXPECT_EQ(s.logLevel, Core::LogLevel::Debug);
    EXPECT_EQ(s.authorityUrl, "https://licensing.example.com");
    EXPECT_EQ(s.authorityTimeout.count(), 2500);
    EXPECT_EQ(s.onlineCheckIntervalDays, 3);
    EXPECT_EQ(s.vaultFile, "firebase_vault.dat");
    EXPECT_EQ(s.licensePath(), "/srv/varsys/lic.dat");
}

TEST(Settings, FromConfigMap_RejectsWrongTypes) {
    ConfigMap config;
    config["online_check_interval_days"] = std::string("weekly");
    EXPECT_ERROR(Settings::fromConfigMap(config), ErrorCode::ConfigInvalid);
    
    ConfigMap negative;
    negative["authority_timeout_ms"] = int64_t{-5};
    EXPECT_ERROR(Settings::fromConfigMap(negative), ErrorCode::ConfigInvalid);
    
    ConfigMap numericPath;
    numericPath["data_dir"] = int64_t{7};
    EXPECT_ERROR(Settings::fromConfigMap(numericPath), ErrorCode::ConfigInvalid);
    
    ConfigMap badLevel;
    badLevel["log_level"] = std::string("loud");
    EXPECT_ERROR(Settings::fromConfigMap(badLevel), ErrorCode::ConfigInvalid);
    
    ConfigMap emptyFeature;
    emptyFeature["vault_feature"] = std::string("");
    EXPECT_ERROR(Settings::fromConfigMap(emptyFeature), ErrorCode::ConfigInvalid);
}

TEST(Settings, FromConfigMap_AcceptsValuesAtTheirCaps) {
    ConfigMap config;
    config["authority_timeout_ms"] = MAX_AUTHORITY_TIMEOUT_MS;
    config["online_check_interval_days"] = MAX_ONLINE_CHECK_INTERVAL_DAYS;
    config["online_retry_backoff_minutes"] = MAX_ONLINE_RETRY_BACKOFF_MINUTES;
    
    auto settings = Settings::fromConfigMap(config);
    ASSERT_RESULT_OK(settings);
    EXPECT_EQ(settings.value().authorityTimeout.count(), 300000);
    EXPECT_EQ(settings.value().onlineCheckIntervalDays, 3650);
    EXPECT_EQ(settings.value().onlineRetryBackoffMinutes, 10080);
}

TEST(Settings, FromConfigMap_RejectsValuesPastTheirCaps) {
    SecureConfigLoader loader;
    const char* oversized[] = {
        "online_check_interval_days = 3651\n",
        "online_check_interval_days = 200000000000000\n",
        "online_retry_backoff_minutes = 10081\n",
        "online_retry_backoff_minutes = 9223372036854775807\n",
        "authority_timeout_ms = 300001\n",
        "online_check_interval_days = 0\n",
    };
    
    for (const char* text : oversized) {
        auto config = loader.loadFromMemory(asBytes(text));
        ASSERT_RESULT_OK(config);
        EXPECT_ERROR(Settings::fromConfigMap(config.value()), ErrorCode::ConfigInvalid);
    }
}

TEST(Settings, ApplyEnvironment_AllSecretsProvided) {
    Settings settings = Settings::defaults();
    settings.applyEnvironment(fakeEnvironment({
        {ENV_APP_SECRET, "app"},
        {ENV_VAULT_SECRET, "vault"},
        {ENV_INTEGRITY_KEY, "integrity"},
        {ENV_DATA_DIR, "/data"},
        {ENV_LICENSE_SERVER, "http://127.0.0.1:8080"},
    }));
    
    EXPECT_FALSE(settings.usingDevelopmentSecrets);
    EXPECT_EQ(settings.appSecret, "app");
    EXPECT_EQ(settings.vaultSecret, "vault");
    EXPECT_EQ(settings.integrityKey, "integrity");
    EXPECT_EQ(settings.dataDir, "/data");
    EXPECT_EQ(settings.authorityUrl, "http://127.0.0.1:8080");
}

TEST(Settings, ApplyEnvironment_MissingSecretFallsBack) {
    Settings settings = Settings::defaults();
    const std::string devVault = settings.vaultSecret;
    
    settings.applyEnvironment(fakeEnvironment({
        {ENV_APP_SECRET, "app"},
        {ENV_INTEGRITY_KEY, "integrity"},
    }));
    
    EXPECT_TRUE(settings.usingDevelopmentSecrets);
    EXPECT_EQ(settings.appSecret, "app");
    EXPECT_EQ(settings.vaultSecret, devVault);
    EXPECT_EQ(settings.dataDir, ".");
}

TEST(Settings, Resolve_AbsolutePathsPassThrough) {
    Settings settings = Settings::defaults();
    settings.dataDir = "/var/lib/varsys";
    
    EXPECT_EQ(settings.resolve("vault.dat"), "/var/lib/varsys/vault.dat");
    EXPECT_EQ(settings.resolve("/etc/varsys/vault.dat"), "/etc/varsys/vault.dat");
}
