/**
 * @file HttpLicenseAuthority.cpp
 * @brief JSON-over-HTTPS license authority client
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/LicenseAuthority.hpp>
#include <Varsys/Core/HttpClient.hpp>
#include <Varsys/Core/Logger.hpp>

#include <nlohmann/json.hpp>

namespace Varsys::License {

using json = nlohmann::json;

namespace {

std::string joinUrl(const std::string& base, const char* path) {
    if (!base.empty() && base.back() == '/') {
        return base.substr(0, base.size() - 1) + path;
    }
    return base + path;
}

std::string errorText(const json& body, const std::string& fallback) {
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return fallback;
}

/**
 * @brief Turn an HTTP exchange into the authority's decision
 * @param body Receives the parsed response body when success=true
 */
Result<void> interpretResponse(const Result<Network::HttpResponse>& sent,
                               const char* operation,
                               json& body) {
    if (sent.isFailure()) {
        if (Network::isTransportError(sent.error())) {
            VARSYS_LOG_WARNING_F("License authority unreachable during %s: %s",
                                 operation, std::string(getErrorName(sent.error())).c_str());
            return ErrorCode::AuthorityUnreachable;
        }
        return sent.error();
    }
    
    const auto& response = sent.value();
    if (response.isServerError()) {
        // 5xx means the authority made no decision
        VARSYS_LOG_WARNING_F("License authority returned %d during %s",
                             response.statusCode, operation);
        return ErrorCode::AuthorityUnreachable;
    }
    
    body = json::parse(response.bodyAsString(), nullptr, false);
    if (response.isClientError()) {
        std::string reason = errorText(body, "HTTP " + std::to_string(response.statusCode));
        VARSYS_LOG_WARNING_F("License authority rejected %s: %s", operation, reason.c_str());
        return ErrorCode::ServerRejected;
    }
    
    if (!body.is_object() || !body.contains("success") || !body["success"].is_boolean()) {
        VARSYS_LOG_ERROR_F("Malformed license authority response during %s", operation);
        return ErrorCode::HttpResponseInvalid;
    }
    
    if (!body["success"].get<bool>()) {
        VARSYS_LOG_WARNING_F("License authority rejected %s: %s", operation,
                             errorText(body, "no reason given").c_str());
        return ErrorCode::ServerRejected;
    }
    
    return {};
}

} // namespace

HttpLicenseAuthority::HttpLicenseAuthority(std::string baseUrl, Milliseconds timeout)
    : HttpLicenseAuthority(std::move(baseUrl), timeout, std::make_shared<Network::HttpClient>())
{
}

HttpLicenseAuthority::HttpLicenseAuthority(std::string baseUrl,
                                           Milliseconds timeout,
                                           std::shared_ptr<Network::HttpClient> client)
    : m_baseUrl(std::move(baseUrl))
    , m_client(std::move(client))
{
    m_client->setDefaultTimeout(timeout);
    m_client->setDefaultMaxAttempts(MAX_ATTEMPTS);
    m_client->addDefaultHeader("X-Varsys-Version", VERSION_STRING);
}

HttpLicenseAuthority::~HttpLicenseAuthority() = default;

Result<LicenseRecord> HttpLicenseAuthority::activate(const ActivationRequest& request) {
    json payload = {
        {"license_key", request.license_key},
        {"email", request.email},
        {"machine_fingerprint", request.machine_fingerprint},
        {"platform", request.platform},
        {"app_version", request.app_version}
    };
    
    json reply;
    VARSYS_TRY(interpretResponse(m_client->postJson(joinUrl(m_baseUrl, "/activate"), payload.dump()),
                                 "activation", reply));
    
    if (!reply.contains("license_data") || !reply["license_data"].is_object()) {
        return ErrorCode::HttpResponseInvalid;
    }
    
    try {
        const json& data = reply["license_data"];
        LicenseRecord record;
        record.user_id = data.at("user_id").get<std::string>();
        record.email = data.value("email", request.email);
        record.license_key = data.value("license_key", request.license_key);
        record.machine_fingerprint = data.value("machine_fingerprint", request.machine_fingerprint);
        record.license_type = data.at("license_type").get<std::string>();
        record.features = data.at("features").get<std::set<std::string>>();
        record.activated_at = data.at("activated_at").get<UnixTime>();
        record.expires_at = data.at("expires_at").get<UnixTime>();
        return record;
    } catch (const json::exception& e) {
        VARSYS_LOG_ERROR_F("Unusable license_data from authority: %s", e.what());
        return ErrorCode::HttpResponseInvalid;
    }
}

Result<void> HttpLicenseAuthority::revalidate(const RevalidationRequest& request) {
    json payload = {
        {"license_key", request.license_key},
        {"machine_fingerprint", request.machine_fingerprint},
        {"user_id", request.user_id}
    };
    
    json reply;
    return interpretResponse(m_client->postJson(joinUrl(m_baseUrl, "/verify"), payload.dump()),
                             "revalidation", reply);
}

} // namespace Varsys::License
