/**
 * @file LicenseStore.cpp
 * @brief License activation, verification and re-validation
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseStore.hpp>
#include <Varsys/Audit/AccessLog.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/FileStore.hpp>
#include <Varsys/Core/Logger.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>

namespace Varsys::License {

namespace {

constexpr const char* KEY_PREFIX = "VARSYS-";
constexpr size_t MIN_KEY_LENGTH = 20;

std::string trimTrailingWhitespace(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

} // namespace

const char* toString(LicenseState state) noexcept {
    switch (state) {
        case LicenseState::Unactivated:       return "unactivated";
        case LicenseState::Active:            return "active";
        case LicenseState::Expired:           return "expired";
        case LicenseState::Tampered:          return "tampered";
        case LicenseState::MachineMismatched: return "machine-mismatched";
        case LicenseState::Deactivated:       return "deactivated";
        case LicenseState::Rejected:          return "rejected";
    }
    return "unknown";
}

// ============================================================================
// LicenseStore::Impl
// ============================================================================

class LicenseStore::Impl {
public:
    Impl(const Config::Settings& settings,
         MachineBinding machine,
         std::shared_ptr<LicenseAuthority> authority,
         Audit::AccessLog& accessLog,
         TimeSource clock)
        : m_settings(settings)
        , m_machine(std::move(machine))
        , m_authority(std::move(authority))
        , m_accessLog(accessLog)
        , m_clock(std::move(clock))
    {
    }
    
    Result<void> activate(const std::string& licenseKey, const std::string& email) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        if (!isWellFormedKey(licenseKey)) {
            m_accessLog.record("activate_license", false, "Invalid license key format");
            return ErrorCode::InvalidLicenseFormat;
        }
        if (email.find('@') == std::string::npos || !Crypto::isValidUtf8(email)) {
            m_accessLog.record("activate_license", false, "Invalid email address");
            return ErrorCode::InvalidArgument;
        }
        if (!m_authority) {
            return ErrorCode::NullPointer;
        }
        
        ActivationRequest request;
        request.license_key = licenseKey;
        request.email = email;
        request.machine_fingerprint = m_machine.fingerprint;
        request.platform = m_machine.platform;
        request.app_version = VERSION_STRING;
        
        auto issued = m_authority->activate(request);
        if (issued.isFailure()) {
            m_accessLog.record("activate_license", false,
                               std::string(getErrorMessage(issued.error())));
            VARSYS_LOG_WARNING_F("License activation failed: %s",
                                 std::string(getErrorName(issued.error())).c_str());
            return issued.error();
        }
        
        LicenseRecord record = std::move(issued.value());
        if (!record.machine_fingerprint.empty() &&
            record.machine_fingerprint != m_machine.fingerprint) {
            m_accessLog.record("activate_license", false, "Authority bound license to another machine");
            return ErrorCode::MachineMismatch;
        }
        record.machine_fingerprint = m_machine.fingerprint;
        record.last_online_check = record.activated_at;
        
        auto persisted = persist(record);
        if (persisted.isFailure()) {
            m_accessLog.record("activate_license", false, "License file could not be written");
            return persisted;
        }
        
        m_deactivated = false;
        m_nextOnlineAttempt = 0;
        m_accessLog.record("activate_license", true,
                           "License activated (" + record.license_type + ")");
        VARSYS_LOG_INFO_F("License activated for %s, expires at %lld",
                          record.email.c_str(), static_cast<long long>(record.expires_at));
        return {};
    }
    
    /**
     * @brief Authenticate the license file, then re-validate online when due
     * 
     * The authority call runs without the lock held so concurrent callers
     * keep verifying offline while one check is in flight.
     */
    Result<LicenseRecord> verify() {
        LicenseRecord current;
        RevalidationRequest request;
        UnixTime now = 0;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            
            auto record = load();
            if (record.isFailure()) {
                return record.error();
            }
            current = std::move(record.value());
            now = m_clock();
            
            if (current.machine_fingerprint != m_machine.fingerprint) {
                m_accessLog.record("verify_license", false, "License is bound to another machine");
                return ErrorCode::MachineMismatch;
            }
            
            if (current.isExpired(now)) {
                m_accessLog.record("verify_license", false, "License expired");
                return ErrorCode::LicenseExpired;
            }
            
            if (!claimOnlineCheck(current, now)) {
                m_accessLog.record("verify_license", true, "License valid");
                return current;
            }
            
            request.license_key = current.license_key;
            request.machine_fingerprint = m_machine.fingerprint;
            request.user_id = current.user_id;
            generation = m_generation;
        }
        
        Result<void> outcome = callAuthority(request);
        
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onlineCheckInFlight = false;
        
        if (outcome.isFailure()) {
            if (outcome.error() == ErrorCode::ServerRejected) {
                m_accessLog.record("online_check", false, "License rejected by authority");
                VARSYS_LOG_WARNING("License rejected during online re-validation");
                return ErrorCode::ServerRejected;
            }
            
            m_nextOnlineAttempt = now + std::clamp<int64_t>(m_settings.onlineRetryBackoffMinutes, 0,
                                                            Config::MAX_ONLINE_RETRY_BACKOFF_MINUTES) * 60;
            m_accessLog.record("online_check", false,
                               "Authority unavailable, continuing offline: " +
                               std::string(getErrorName(outcome.error())));
            VARSYS_LOG_WARNING_F("Online license check failed (%s), continuing offline",
                                 std::string(getErrorName(outcome.error())).c_str());
        } else {
            current.last_online_check = now;
            recordOnlineCheck(current, generation);
        }
        
        m_accessLog.record("verify_license", true, "License valid");
        return current;
    }
    
    Result<void> deactivate() {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto removed = IO::removeFile(m_settings.licensePath());
        if (removed.isFailure()) {
            ErrorCode err = removed.error() == ErrorCode::FileNotFound
                ? ErrorCode::LicenseNotFound : removed.error();
            m_accessLog.record("deactivate_license", false, std::string(getErrorMessage(err)));
            return err;
        }
        
        m_deactivated = true;
        ++m_generation;
        m_accessLog.record("deactivate_license", true, "License file removed");
        VARSYS_LOG_INFO("License deactivated");
        return {};
    }
    
    LicenseState stateFor(ErrorCode error) const {
        switch (error) {
            case ErrorCode::Success:
                return LicenseState::Active;
            case ErrorCode::LicenseNotFound:
                return m_deactivated ? LicenseState::Deactivated : LicenseState::Unactivated;
            case ErrorCode::LicenseExpired:
                return LicenseState::Expired;
            case ErrorCode::MachineMismatch:
                return LicenseState::MachineMismatched;
            case ErrorCode::ServerRejected:
                return LicenseState::Rejected;
            default:
                return LicenseState::Tampered;
        }
    }
    
    UnixTime now() const { return m_clock(); }
    
    const std::string& fingerprint() const noexcept { return m_machine.fingerprint; }

private:
    /**
     * @brief Read, decrypt and authenticate the license file
     */
    Result<LicenseRecord> load() {
        auto contents = IO::readTextFile(m_settings.licensePath());
        if (contents.isFailure()) {
            if (contents.error() == ErrorCode::FileNotFound) {
                m_accessLog.record("verify_license", false, "No license found");
                return ErrorCode::LicenseNotFound;
            }
            m_accessLog.record("verify_license", false, "License file unreadable");
            return contents.error();
        }
        
        auto record = openRecord(trimTrailingWhitespace(std::move(contents.value())),
                                 m_settings.appSecret, m_machine.fingerprint);
        if (record.isFailure()) {
            m_accessLog.record("verify_license", false, "License file could not be decrypted");
            return ErrorCode::LicenseTampered;
        }
        
        if (!verifyRecordSignature(record.value(), m_settings.appSecret)) {
            m_accessLog.record("verify_license", false, "License signature mismatch");
            VARSYS_LOG_WARNING("License signature mismatch");
            return ErrorCode::LicenseTampered;
        }
        
        return record;
    }
    
    /**
     * @brief Sign, seal and atomically write the record
     */
    Result<void> persist(LicenseRecord& record) {
        std::string signature;
        VARSYS_TRY_ASSIGN(signature, signRecord(record, m_settings.appSecret));
        record.signature = std::move(signature);
        
        std::string sealed;
        VARSYS_TRY_ASSIGN(sealed, sealRecord(record, m_settings.appSecret, m_machine.fingerprint));
        
        VARSYS_TRY(IO::ensureDirectory(m_settings.dataDir));
        VARSYS_TRY(IO::writeFileAtomic(m_settings.licensePath(), asBytes(sealed)));
        ++m_generation;
        return {};
    }
    
    /**
     * @brief Decide whether this caller performs the online check
     * 
     * Called with the lock held. At most one check is in flight, and a
     * failed attempt defers the next one by the retry backoff.
     */
    bool claimOnlineCheck(const LicenseRecord& record, UnixTime now) {
        if (!m_authority || m_onlineCheckInFlight) {
            return false;
        }
        const UnixTime interval = std::clamp<int64_t>(m_settings.onlineCheckIntervalDays, 0,
                                                      Config::MAX_ONLINE_CHECK_INTERVAL_DAYS) *
                                  SECONDS_PER_DAY;
        if (now - record.last_online_check <= interval) {
            return false;
        }
        if (now < m_nextOnlineAttempt) {
            VARSYS_LOG_DEBUG("Online license check deferred by retry backoff");
            return false;
        }
        m_onlineCheckInFlight = true;
        return true;
    }
    
    /**
     * @brief Ask the authority to confirm the license
     * 
     * Only an explicit rejection fails verification. An exception from the
     * authority is treated like an unreachable server.
     */
    Result<void> callAuthority(const RevalidationRequest& request) {
        try {
            return m_authority->revalidate(request);
        } catch (const std::exception& e) {
            VARSYS_LOG_ERROR_F("Online license check raised: %s", e.what());
            return ErrorCode::AuthorityUnreachable;
        }
    }
    
    /**
     * @brief Persist a confirmed check unless the file changed meanwhile
     * 
     * Called with the lock held.
     */
    void recordOnlineCheck(LicenseRecord& record, uint64_t generation) {
        if (generation != m_generation) {
            VARSYS_LOG_INFO("License replaced during online check; confirmation not recorded");
            m_accessLog.record("online_check", true, "License confirmed, record not updated");
            return;
        }
        
        auto persisted = persist(record);
        if (persisted.isFailure()) {
            // The license is valid; the next verify() simply checks online again
            VARSYS_LOG_ERROR_F("Could not record online check: %s",
                               std::string(getErrorMessage(persisted.error())).c_str());
            m_accessLog.record("online_check", true, "License confirmed, record not updated");
            return;
        }
        
        m_nextOnlineAttempt = 0;
        m_accessLog.record("online_check", true, "License confirmed by authority");
    }
    
    const Config::Settings& m_settings;
    MachineBinding m_machine;
    std::shared_ptr<LicenseAuthority> m_authority;
    Audit::AccessLog& m_accessLog;
    TimeSource m_clock;
    
    std::mutex m_mutex;
    UnixTime m_nextOnlineAttempt = 0;
    uint64_t m_generation = 0;
    bool m_onlineCheckInFlight = false;
    std::atomic<bool> m_deactivated{false};
};

// ============================================================================
// LicenseStore public interface
// ============================================================================

LicenseStore::LicenseStore(const Config::Settings& settings,
                           MachineBinding machine,
                           std::shared_ptr<LicenseAuthority> authority,
                           Audit::AccessLog& accessLog,
                           TimeSource clock)
    : m_impl(std::make_unique<Impl>(settings, std::move(machine), std::move(authority),
                                    accessLog, std::move(clock)))
{
}

LicenseStore::~LicenseStore() = default;

Result<void> LicenseStore::activate(const std::string& licenseKey, const std::string& email) {
    return m_impl->activate(licenseKey, email);
}

Result<LicenseRecord> LicenseStore::verify() {
    return m_impl->verify();
}

Result<void> LicenseStore::deactivate() {
    return m_impl->deactivate();
}

bool LicenseStore::isFeatureEnabled(std::string_view feature) noexcept {
    try {
        auto record = m_impl->verify();
        return record.isSuccess() && record.value().grants(feature);
    } catch (const std::exception& e) {
        VARSYS_LOG_ERROR_F("Feature check failed: %s", e.what());
        return false;
    }
}

Result<LicenseInfo> LicenseStore::info() {
    auto record = m_impl->verify();
    if (record.isFailure()) {
        return record.error();
    }
    
    const LicenseRecord& current = record.value();
    LicenseInfo info;
    info.email = current.email;
    info.license_type = current.license_type;
    info.activated_at = current.activated_at;
    info.expires_at = current.expires_at;
    info.last_online_check = current.last_online_check;
    info.features = current.features;
    info.days_remaining = (current.expires_at - m_impl->now()) / SECONDS_PER_DAY;
    return info;
}

LicenseState LicenseStore::status() {
    auto record = m_impl->verify();
    return m_impl->stateFor(record.errorOr(ErrorCode::Success));
}

const std::string& LicenseStore::machineFingerprint() const noexcept {
    return m_impl->fingerprint();
}

bool LicenseStore::isWellFormedKey(std::string_view licenseKey) noexcept {
    if (licenseKey.size() < MIN_KEY_LENGTH || licenseKey.substr(0, 7) != KEY_PREFIX) {
        return false;
    }
    for (char c : licenseKey) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

} // namespace Varsys::License
