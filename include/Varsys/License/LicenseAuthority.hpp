/**
 * @file LicenseAuthority.hpp
 * @brief Issuer of licenses: network and in-memory implementations
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_LICENSE_LICENSE_AUTHORITY_HPP
#define VARSYS_LICENSE_LICENSE_AUTHORITY_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <Varsys/License/LicenseRecord.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace Varsys::Network {
class HttpClient;
}

namespace Varsys::License {

/**
 * @brief Data sent to the authority when activating a key
 */
struct ActivationRequest {
    std::string license_key;
    std::string email;
    std::string machine_fingerprint;
    std::string platform;
    std::string app_version;
};

/**
 * @brief Data sent to the authority for periodic re-validation
 */
struct RevalidationRequest {
    std::string license_key;
    std::string machine_fingerprint;
    std::string user_id;
};

/**
 * @brief License-issuing authority
 * 
 * activate() returns the unsigned record body (user_id, email, license_key,
 * machine_fingerprint, license_type, features, activated_at, expires_at).
 * LicenseStore signs and persists it.
 * 
 * Errors:
 * - ServerRejected: the authority explicitly declined
 * - AuthorityUnreachable: transport failure, no decision was made
 * - HttpResponseInvalid: the authority answered with something unusable
 */
class LicenseAuthority {
public:
    virtual ~LicenseAuthority() = default;
    
    virtual Result<LicenseRecord> activate(const ActivationRequest& request) = 0;
    
    virtual Result<void> revalidate(const RevalidationRequest& request) = 0;
};

// ============================================================================
// HttpLicenseAuthority
// ============================================================================

/**
 * @brief Authority reached over HTTPS with JSON bodies
 * 
 * POST {baseUrl}/activate and POST {baseUrl}/verify. The response is
 * `{"success": bool, "license_data": {...}, "error": "..."}`, with
 * activated_at and expires_at in Unix seconds.
 * 
 * Each attempt is bounded by the configured timeout. A connection that is
 * refused or dropped before a reply is retried once; a timeout is not.
 */
class HttpLicenseAuthority : public LicenseAuthority {
public:
    HttpLicenseAuthority(std::string baseUrl, Milliseconds timeout);
    
    HttpLicenseAuthority(std::string baseUrl,
                         Milliseconds timeout,
                         std::shared_ptr<Network::HttpClient> client);
    
    ~HttpLicenseAuthority() override;
    
    Result<LicenseRecord> activate(const ActivationRequest& request) override;
    
    Result<void> revalidate(const RevalidationRequest& request) override;
    
    const std::string& baseUrl() const noexcept { return m_baseUrl; }
    
    /// Attempts per call for transient connection failures
    static constexpr int MAX_ATTEMPTS = 2;

private:
    std::string m_baseUrl;
    std::shared_ptr<Network::HttpClient> m_client;
};

// ============================================================================
// InMemoryLicenseAuthority
// ============================================================================

/**
 * @brief Offline authority used when no server is configured, and by tests
 * 
 * Accepts any key of the form `VARSYS-...` that is at least 20 characters
 * long and issues a commercial license valid for validityDays with the
 * default feature set. Keys can be revoked and revalidation can be scripted.
 */
class InMemoryLicenseAuthority : public LicenseAuthority {
public:
    /// Scripted outcome of revalidate()
    enum class RevalidationMode {
        Accept,
        Reject,
        Unreachable
    };
    
    explicit InMemoryLicenseAuthority(TimeSource clock = unixNow);
    
    Result<LicenseRecord> activate(const ActivationRequest& request) override;
    
    Result<void> revalidate(const RevalidationRequest& request) override;
    
    /// Reject activation and revalidation of this key from now on
    void revokeKey(const std::string& licenseKey);
    
    /// Features placed in newly issued licenses
    void setIssuedFeatures(std::set<std::string> features);
    
    /// Lifetime of newly issued licenses
    void setValidityDays(int64_t days);
    
    void setRevalidationMode(RevalidationMode mode);
    
    /// Make activate() fail as if the network were down
    void setActivationUnreachable(bool unreachable);
    
    size_t activationCount() const noexcept { return m_activations.load(); }
    size_t revalidationCount() const noexcept { return m_revalidations.load(); }
    
    /// Default feature set of issued licenses
    static std::set<std::string> defaultFeatures();

private:
    TimeSource m_clock;
    mutable std::mutex m_mutex;
    std::set<std::string> m_revoked;
    std::set<std::string> m_features;
    int64_t m_validityDays = 365;
    RevalidationMode m_revalidationMode = RevalidationMode::Accept;
    bool m_activationUnreachable = false;
    std::atomic<size_t> m_activations{0};
    std::atomic<size_t> m_revalidations{0};
};

} // namespace Varsys::License

#endif // VARSYS_LICENSE_LICENSE_AUTHORITY_HPP
