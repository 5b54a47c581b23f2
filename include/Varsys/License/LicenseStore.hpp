/**
 * @file LicenseStore.hpp
 * @brief Lifecycle of the license activated on this machine
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_LICENSE_LICENSE_STORE_HPP
#define VARSYS_LICENSE_LICENSE_STORE_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <Varsys/Core/Config.hpp>
#include <Varsys/License/LicenseRecord.hpp>
#include <Varsys/License/LicenseAuthority.hpp>
#include <Varsys/License/MachineIdentity.hpp>

#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace Varsys::Audit {
class AccessLog;
}

namespace Varsys::License {

/**
 * @brief Coarse license state for display and diagnostics
 */
enum class LicenseState : uint8_t {
    Unactivated,        ///< No license file
    Active,             ///< verify() succeeds
    Expired,
    Tampered,           ///< File does not decrypt or the signature is wrong
    MachineMismatched,
    Deactivated,        ///< Removed by deactivate() in this process
    Rejected            ///< Authority refused re-validation
};

/**
 * @brief Human-readable state name
 */
const char* toString(LicenseState state) noexcept;

/**
 * @brief Summary of a valid license
 */
struct LicenseInfo {
    std::string email;
    std::string license_type;
    UnixTime activated_at = 0;
    UnixTime expires_at = 0;
    UnixTime last_online_check = 0;
    std::set<std::string> features;
    int64_t days_remaining = 0;
};

/**
 * @brief Activates, verifies and deactivates the machine's license
 * 
 * The license lives in a single file (Settings::licensePath()) holding
 * base64(AES-256-GCM(record JSON)) under a key derived from the application
 * secret and the machine fingerprint. The record carries an HMAC-SHA256
 * signature that is recomputed on every verify().
 * 
 * verify() checks, in order: presence, decryption and signature, machine
 * binding, expiry, then an online re-validation when the last successful
 * one is older than Settings::onlineCheckIntervalDays. An authority that
 * cannot be reached does not fail verification; the attempt is audited and
 * further attempts wait Settings::onlineRetryBackoffMinutes.
 * 
 * All operations are serialized by an internal mutex.
 * 
 * @example
 * ```cpp
 * LicenseStore store(settings, identity.binding(), authority, accessLog);
 * if (store.activate("VARSYS-AAAA-BBBB-CCCC-DDDD", "a@b.com")) {
 *     auto record = store.verify();
 * }
 * ```
 */
class LicenseStore {
public:
    LicenseStore(const Config::Settings& settings,
                 MachineBinding machine,
                 std::shared_ptr<LicenseAuthority> authority,
                 Audit::AccessLog& accessLog,
                 TimeSource clock = unixNow);
    
    ~LicenseStore();
    
    LicenseStore(const LicenseStore&) = delete;
    LicenseStore& operator=(const LicenseStore&) = delete;
    
    /**
     * @brief Activate a license key for this machine
     * 
     * @param licenseKey Key of the form VARSYS-XXXX-... (>= 20 chars, [A-Z0-9-])
     * @param email Account e-mail (must contain '@')
     * @return Success, InvalidLicenseFormat, InvalidArgument, ServerRejected,
     *         AuthorityUnreachable, or a file write error
     */
    Result<void> activate(const std::string& licenseKey, const std::string& email);
    
    /**
     * @brief Verify the stored license
     * @return The record, or LicenseNotFound, LicenseTampered,
     *         MachineMismatch, LicenseExpired, ServerRejected
     */
    Result<LicenseRecord> verify();
    
    /**
     * @brief Remove the license file
     * @return Success or LicenseNotFound
     */
    Result<void> deactivate();
    
    /**
     * @brief Whether a valid license grants the feature (or full_access)
     */
    bool isFeatureEnabled(std::string_view feature) noexcept;
    
    /**
     * @brief Summary of the verified license
     */
    Result<LicenseInfo> info();
    
    /**
     * @brief Current state derived from verify()
     */
    LicenseState status();
    
    const std::string& machineFingerprint() const noexcept;
    
    /**
     * @brief Local format check applied before contacting the authority
     */
    static bool isWellFormedKey(std::string_view licenseKey) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Varsys::License

#endif // VARSYS_LICENSE_LICENSE_STORE_HPP
