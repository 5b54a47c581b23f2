/**
 * @file HttpClientImpl.cpp
 * @brief HttpClient implementation using libcurl
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/HttpClient.hpp>
#include <Varsys/Core/Logger.hpp>
#include "TlsContext.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace Varsys::Network {

// ============================================================================
// Global cURL initialization
// ============================================================================

namespace {

std::once_flag g_curlInitFlag;
bool g_curlInitialized = false;

void initializeCurl() {
    std::call_once(g_curlInitFlag, []() {
        g_curlInitialized = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    });
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// ============================================================================
// cURL callbacks
// ============================================================================

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* buffer = static_cast<ByteBuffer*>(userp);
    
    try {
        const Byte* data = static_cast<const Byte*>(contents);
        buffer->insert(buffer->end(), data, data + realsize);
        return realsize;
    } catch (const std::bad_alloc&) {
        // Short count makes curl abort with CURLE_WRITE_ERROR
        return 0;
    }
}

size_t headerCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* headers = static_cast<HttpHeaders*>(userp);
    
    std::string header(buffer, realsize);
    size_t colonPos = header.find(':');
    if (colonPos != std::string::npos && colonPos > 0) {
        std::string name = toLower(header.substr(0, colonPos));
        std::string value = header.substr(colonPos + 1);
        
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);
        
        (*headers)[name] = value;
    }
    
    return realsize;
}

ErrorCode mapCurlError(CURLcode res) noexcept {
    switch (res) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return ErrorCode::DnsResolutionFailed;
        case CURLE_COULDNT_CONNECT:
            return ErrorCode::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
            return ErrorCode::TlsHandshakeFailed;
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCode::CertificateInvalid;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return ErrorCode::ConnectionReset;
        default:
            return ErrorCode::NetworkError;
    }
}

bool isTransientCurlError(CURLcode res) noexcept {
    return res == CURLE_COULDNT_CONNECT ||
           res == CURLE_RECV_ERROR ||
           res == CURLE_SEND_ERROR ||
           res == CURLE_GOT_NOTHING;
}

struct CurlHandle {
    CURL* handle;
    ~CurlHandle() {
        if (handle) curl_easy_cleanup(handle);
    }
};

struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() {
        if (list) curl_slist_free_all(list);
    }
};

} // namespace

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    Impl() {
        initializeCurl();
    }
    
    Result<HttpResponse> send(const HttpRequest& request) {
        if (!g_curlInitialized) {
            return ErrorCode::CurlInitFailed;
        }
        if (request.url.empty()) {
            return ErrorCode::InvalidArgument;
        }
        
        HttpHeaders allHeaders;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            allHeaders = m_defaultHeaders;
        }
        for (const auto& [name, value] : request.headers) {
            allHeaders[name] = value;
        }
        
        CurlHandle curl{curl_easy_init()};
        if (!curl.handle) {
            return ErrorCode::CurlInitFailed;
        }
        
        ErrorCode tls = configureTlsVersion(curl.handle);
        if (tls != ErrorCode::Success) {
            return tls;
        }
        tls = configureTlsVerification(curl.handle);
        if (tls != ErrorCode::Success) {
            return tls;
        }
        
        curl_easy_setopt(curl.handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.handle, CURLOPT_PROTOCOLS_STR, "http,https");
        
        if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl.handle, CURLOPT_POST, 1L);
            curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
            curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS,
                             reinterpret_cast<const char*>(request.body.data()));
        } else {
            curl_easy_setopt(curl.handle, CURLOPT_HTTPGET, 1L);
        }
        
        HeaderList headerList;
        for (const auto& [name, value] : allHeaders) {
            std::string line = name + ": " + value;
            curl_slist* appended = curl_slist_append(headerList.list, line.c_str());
            if (!appended) {
                return ErrorCode::AllocationFailed;
            }
            headerList.list = appended;
        }
        if (headerList.list) {
            curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, headerList.list);
        }
        
        long timeoutMs = static_cast<long>(request.timeout.count());
        curl_easy_setopt(curl.handle, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT_MS, timeoutMs);
        
        if (request.followRedirects) {
            curl_easy_setopt(curl.handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.handle, CURLOPT_MAXREDIRS, 3L);
        }
        
        curl_easy_setopt(curl.handle, CURLOPT_USERAGENT, request.userAgent.c_str());
        
        HttpResponse response;
        curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.handle, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl.handle, CURLOPT_HEADERDATA, &response.headers);
        
        const int attempts = std::max(1, request.maxAttempts);
        CURLcode res = CURLE_OK;
        auto retryDelay = Milliseconds(500);
        auto startTime = std::chrono::steady_clock::now();
        
        for (int attempt = 0; attempt < attempts; ++attempt) {
            response.body.clear();
            response.headers.clear();
            
            res = curl_easy_perform(curl.handle);
            if (res == CURLE_OK || !isTransientCurlError(res) || attempt == attempts - 1) {
                break;
            }
            
            VARSYS_LOG_DEBUG_F("HTTP attempt %d to %s failed: %s",
                               attempt + 1, request.url.c_str(), curl_easy_strerror(res));
            std::this_thread::sleep_for(retryDelay);
            retryDelay *= 2;
        }
        
        response.elapsed = std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        
        if (res != CURLE_OK) {
            VARSYS_LOG_WARNING_F("HTTP request to %s failed: %s",
                                 request.url.c_str(), curl_easy_strerror(res));
            return mapCurlError(res);
        }
        
        long httpCode = 0;
        curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        
        return response;
    }
    
    void addDefaultHeader(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defaultHeaders[name] = value;
    }
    
    void setDefaultTimeout(Milliseconds timeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defaultTimeout = timeout;
    }
    
    void setDefaultMaxAttempts(int attempts) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defaultMaxAttempts = std::max(1, attempts);
    }
    
    HttpRequest makeRequest(HttpMethod method, const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        HttpRequest request;
        request.method = method;
        request.url = url;
        request.timeout = m_defaultTimeout;
        request.maxAttempts = m_defaultMaxAttempts;
        return request;
    }

private:
    mutable std::mutex m_mutex;
    HttpHeaders m_defaultHeaders;
    Milliseconds m_defaultTimeout{30000};
    int m_defaultMaxAttempts = 3;
};

// ============================================================================
// HttpResponse
// ============================================================================

std::string HttpResponse::getHeader(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    return m_impl->send(request);
}

Result<HttpResponse> HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    HttpRequest request = m_impl->makeRequest(HttpMethod::GET, url);
    request.headers = headers;
    return send(request);
}

Result<HttpResponse> HttpClient::post(
    const std::string& url,
    const ByteBuffer& body,
    const HttpHeaders& headers
) {
    HttpRequest request = m_impl->makeRequest(HttpMethod::POST, url);
    request.body = body;
    request.headers = headers;
    return send(request);
}

Result<HttpResponse> HttpClient::postJson(
    const std::string& url,
    const std::string& json,
    const HttpHeaders& headers
) {
    auto allHeaders = headers;
    allHeaders["Content-Type"] = "application/json";
    allHeaders["Accept"] = "application/json";
    return post(url, ByteBuffer(json.begin(), json.end()), allHeaders);
}

void HttpClient::addDefaultHeader(const std::string& name, const std::string& value) {
    m_impl->addDefaultHeader(name, value);
}

void HttpClient::setDefaultTimeout(Milliseconds timeout) {
    m_impl->setDefaultTimeout(timeout);
}

void HttpClient::setDefaultMaxAttempts(int attempts) {
    m_impl->setDefaultMaxAttempts(attempts);
}

} // namespace Varsys::Network
