/**
 * @file TlsContext.cpp
 * @brief TLS settings applied to every cURL handle
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include "TlsContext.hpp"

namespace Varsys::Network {

ErrorCode configureTlsVersion(CURL* curl) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }
    
    // TLS 1.2 minimum; 1.3 is negotiated when the server offers it
    if (curl_easy_setopt(curl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2) != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }
    
    return ErrorCode::Success;
}

ErrorCode configureTlsVerification(CURL* curl) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }
    
    if (curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L) != CURLE_OK ||
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L) != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }
    
    return ErrorCode::Success;
}

} // namespace Varsys::Network
