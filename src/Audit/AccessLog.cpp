/**
 * @file AccessLog.cpp
 * @brief NDJSON audit trail
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Audit/AccessLog.hpp>
#include <Varsys/Core/FileStore.hpp>
#include <Varsys/Core/Logger.hpp>

#include <nlohmann/json.hpp>

#include <ctime>
#include <sstream>

namespace Varsys::Audit {

using json = nlohmann::json;

namespace {

std::string localTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer, n);
}

} // namespace

AccessLog::AccessLog(std::string path, std::string machineFingerprint)
    : m_path(std::move(path))
    , m_fingerprint(std::move(machineFingerprint))
{
}

void AccessLog::record(std::string_view action, bool success, std::string_view details) noexcept {
    try {
        json entry = {
            {"timestamp", localTimestamp()},
            {"action", std::string(action)},
            {"success", success},
            {"machine_fingerprint", m_fingerprint},
            {"details", std::string(details)}
        };
        // Replace invalid UTF-8 instead of throwing
        std::string line = entry.dump(-1, ' ', false, json::error_handler_t::replace);
        
        std::lock_guard<std::mutex> lock(m_mutex);
        auto written = IO::appendLine(m_path, line);
        if (written.isFailure() && !m_failureReported.exchange(true)) {
            VARSYS_LOG_ERROR_F("Access log %s is not writable: %s", m_path.c_str(),
                               std::string(getErrorMessage(written.error())).c_str());
        }
    } catch (const std::exception& e) {
        if (!m_failureReported.exchange(true)) {
            VARSYS_LOG_ERROR_F("Access log entry dropped: %s", e.what());
        }
    }
}

Result<std::vector<AuditLogEntry>> AccessLog::entries() const {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto contents = IO::readTextFile(m_path);
        if (contents.isFailure()) {
            if (contents.error() == ErrorCode::FileNotFound) {
                return std::vector<AuditLogEntry>{};
            }
            return contents.error();
        }
        text = std::move(contents.value());
    }
    
    std::vector<AuditLogEntry> result;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            continue;
        }
        
        try {
            AuditLogEntry entry;
            entry.timestamp = j.at("timestamp").get<std::string>();
            entry.action = j.at("action").get<std::string>();
            entry.success = j.at("success").get<bool>();
            entry.machine_fingerprint = j.at("machine_fingerprint").get<std::string>();
            entry.details = j.at("details").get<std::string>();
            result.push_back(std::move(entry));
        } catch (const json::exception&) {
            continue;
        }
    }
    return result;
}

} // namespace Varsys::Audit
