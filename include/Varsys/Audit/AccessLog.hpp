/**
 * @file AccessLog.hpp
 * @brief Append-only security audit trail
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_AUDIT_ACCESS_LOG_HPP
#define VARSYS_AUDIT_ACCESS_LOG_HPP

#include <Varsys/Core/ErrorCodes.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Varsys::Audit {

/**
 * @brief One line of the audit trail
 */
struct AuditLogEntry {
    std::string timestamp;            ///< Local time, "%Y-%m-%d %H:%M:%S"
    std::string action;
    bool success = false;
    std::string machine_fingerprint;
    std::string details;
};

/**
 * @brief Records every license and vault access attempt
 * 
 * Each call to record() appends one compact JSON object per line. Entries
 * never contain secret material. Recording never fails from the caller's
 * point of view: an unwritable trail is reported once through the Logger
 * and otherwise ignored, so audit trouble cannot block a security decision.
 * 
 * Thread-safe.
 */
class AccessLog {
public:
    /**
     * @param path Log file path (created on first record)
     * @param machineFingerprint Fingerprint stamped on every entry
     */
    AccessLog(std::string path, std::string machineFingerprint);
    
    AccessLog(const AccessLog&) = delete;
    AccessLog& operator=(const AccessLog&) = delete;
    
    /**
     * @brief Append an entry
     */
    void record(std::string_view action, bool success, std::string_view details) noexcept;
    
    /**
     * @brief Read the trail back, skipping malformed lines
     * @return Entries in file order (empty when the file does not exist)
     */
    Result<std::vector<AuditLogEntry>> entries() const;
    
    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
    std::string m_fingerprint;
    mutable std::mutex m_mutex;
    std::atomic<bool> m_failureReported{false};
};

} // namespace Varsys::Audit

#endif // VARSYS_AUDIT_ACCESS_LOG_HPP
