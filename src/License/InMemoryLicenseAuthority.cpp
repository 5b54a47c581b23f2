/**
 * @file InMemoryLicenseAuthority.cpp
 * @brief Offline license authority
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseAuthority.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Logger.hpp>

namespace Varsys::License {

namespace {

constexpr size_t MIN_KEY_LENGTH = 20;

/// Random RFC 4122 version 4 identifier
Result<std::string> makeUserId() {
    Crypto::SecureRandom rng;
    auto bytes = rng.generate(16);
    if (bytes.isFailure()) {
        return bytes.error();
    }
    auto& b = bytes.value();
    b[6] = static_cast<Byte>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<Byte>((b[8] & 0x3F) | 0x80);
    
    std::string hex = Crypto::toHex(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

} // namespace

InMemoryLicenseAuthority::InMemoryLicenseAuthority(TimeSource clock)
    : m_clock(std::move(clock))
    , m_features(defaultFeatures())
{
}

std::set<std::string> InMemoryLicenseAuthority::defaultFeatures() {
    return {FEATURE_FULL_ACCESS, "firebase_sync", "ai_insights", "reports"};
}

Result<LicenseRecord> InMemoryLicenseAuthority::activate(const ActivationRequest& request) {
    ++m_activations;
    
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activationUnreachable) {
        return ErrorCode::AuthorityUnreachable;
    }
    
    if (request.license_key.size() < MIN_KEY_LENGTH ||
        request.license_key.rfind("VARSYS-", 0) != 0) {
        VARSYS_LOG_INFO("Offline authority: invalid license key format");
        return ErrorCode::ServerRejected;
    }
    if (m_revoked.count(request.license_key) > 0) {
        VARSYS_LOG_INFO("Offline authority: license key revoked");
        return ErrorCode::ServerRejected;
    }
    
    std::string userId;
    VARSYS_TRY_ASSIGN(userId, makeUserId());
    
    LicenseRecord record;
    record.user_id = std::move(userId);
    record.email = request.email;
    record.license_key = request.license_key;
    record.machine_fingerprint = request.machine_fingerprint;
    record.license_type = "commercial";
    record.features = m_features;
    record.activated_at = m_clock();
    record.expires_at = record.activated_at + m_validityDays * SECONDS_PER_DAY;
    return record;
}

Result<void> InMemoryLicenseAuthority::revalidate(const RevalidationRequest& request) {
    ++m_revalidations;
    
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_revoked.count(request.license_key) > 0) {
        return ErrorCode::ServerRejected;
    }
    
    switch (m_revalidationMode) {
        case RevalidationMode::Accept:
            return {};
        case RevalidationMode::Reject:
            return ErrorCode::ServerRejected;
        case RevalidationMode::Unreachable:
            return ErrorCode::AuthorityUnreachable;
    }
    return ErrorCode::InternalError;
}

void InMemoryLicenseAuthority::revokeKey(const std::string& licenseKey) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_revoked.insert(licenseKey);
}

void InMemoryLicenseAuthority::setIssuedFeatures(std::set<std::string> features) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_features = std::move(features);
}

void InMemoryLicenseAuthority::setValidityDays(int64_t days) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_validityDays = days;
}

void InMemoryLicenseAuthority::setRevalidationMode(RevalidationMode mode) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_revalidationMode = mode;
}

void InMemoryLicenseAuthority::setActivationUnreachable(bool unreachable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_activationUnreachable = unreachable;
}

} // namespace Varsys::License
