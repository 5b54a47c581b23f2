/**
 * @file HttpClient.hpp
 * @brief HTTPS client used to reach the license authority
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * libcurl-backed client. TLS 1.2 is the minimum protocol version, peer and
 * host verification are always on, and every request carries an explicit
 * timeout.
 */

#pragma once

#ifndef VARSYS_CORE_HTTP_CLIENT_HPP
#define VARSYS_CORE_HTTP_CLIENT_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <map>
#include <memory>
#include <string>

namespace Varsys::Network {

// ============================================================================
// HTTP Types
// ============================================================================

/**
 * @brief HTTP methods
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP header map
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    ByteBuffer body;
    
    /// Connect and total timeout
    Milliseconds timeout{30000};
    
    /// Attempts for transient connection errors (timeouts are never retried)
    int maxAttempts = 3;
    
    /// Follow redirects
    bool followRedirects = false;
    
    /// User agent string
    std::string userAgent = "Varsys/2.0";
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    /// HTTP status code
    int statusCode = 0;
    
    /// Response headers (names lowercased)
    HttpHeaders headers;
    
    /// Response body
    ByteBuffer body;
    
    /// Total time taken
    Milliseconds elapsed{0};
    
    /// Check if request was successful (2xx)
    [[nodiscard]] bool isSuccess() const noexcept {
        return statusCode >= 200 && statusCode < 300;
    }
    
    /// Check if request had client error (4xx)
    [[nodiscard]] bool isClientError() const noexcept {
        return statusCode >= 400 && statusCode < 500;
    }
    
    /// Check if request had server error (5xx)
    [[nodiscard]] bool isServerError() const noexcept {
        return statusCode >= 500 && statusCode < 600;
    }
    
    /// Get body as string
    [[nodiscard]] std::string bodyAsString() const {
        return std::string(body.begin(), body.end());
    }
    
    /// Get header value (case-insensitive), empty if absent
    [[nodiscard]] std::string getHeader(const std::string& name) const;
};

// ============================================================================
// HTTP Client
// ============================================================================

/**
 * @brief HTTPS client
 * 
 * @example
 * ```cpp
 * HttpClient client;
 * client.setDefaultTimeout(Milliseconds{5000});
 * auto response = client.postJson("https://license.example.com/verify", body);
 * if (response.isSuccess() && response.value().isSuccess()) {
 *     auto reply = nlohmann::json::parse(response.value().bodyAsString());
 * }
 * ```
 * 
 * Transport failures are returned as errors (DnsResolutionFailed,
 * ConnectionFailed, Timeout, TlsHandshakeFailed, CertificateInvalid,
 * NetworkError); any HTTP status, including 4xx/5xx, is a successful
 * Result carrying the response.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;
    
    /**
     * @brief Send HTTP request
     * @param request Request configuration
     * @return Response or error
     */
    Result<HttpResponse> send(const HttpRequest& request);
    
    /**
     * @brief Send GET request with the default timeout and attempt count
     */
    Result<HttpResponse> get(
        const std::string& url,
        const HttpHeaders& headers = {}
    );
    
    /**
     * @brief Send POST request with the default timeout and attempt count
     */
    Result<HttpResponse> post(
        const std::string& url,
        const ByteBuffer& body,
        const HttpHeaders& headers = {}
    );
    
    /**
     * @brief Send POST request with a JSON body
     * @param url Request URL
     * @param json Serialized JSON body
     * @param headers Optional headers (Content-Type is set)
     * @return Response or error
     */
    Result<HttpResponse> postJson(
        const std::string& url,
        const std::string& json,
        const HttpHeaders& headers = {}
    );
    
    /**
     * @brief Add a header sent with every request
     */
    void addDefaultHeader(const std::string& name, const std::string& value);
    
    /**
     * @brief Set timeout used by get/post/postJson
     */
    void setDefaultTimeout(Milliseconds timeout);
    
    /**
     * @brief Set attempt count used by get/post/postJson (minimum 1)
     */
    void setDefaultMaxAttempts(int attempts);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief True for errors produced by the transport rather than by the peer
 */
[[nodiscard]] constexpr bool isTransportError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionReset:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::TlsHandshakeFailed:
        case ErrorCode::CertificateInvalid:
        case ErrorCode::NetworkUnreachable:
        case ErrorCode::Timeout:
        case ErrorCode::CurlInitFailed:
            return true;
        default:
            return false;
    }
}

} // namespace Varsys::Network

#endif // VARSYS_CORE_HTTP_CLIENT_HPP
