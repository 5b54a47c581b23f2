/**
 * @file TlsContext.hpp
 * @brief Internal TLS configuration helpers for HttpClient
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_NETWORK_TLS_CONTEXT_HPP
#define VARSYS_NETWORK_TLS_CONTEXT_HPP

#include <Varsys/Core/ErrorCodes.hpp>
#include <curl/curl.h>

namespace Varsys::Network {

/**
 * @brief Require TLS 1.2 or newer
 */
ErrorCode configureTlsVersion(CURL* curl);

/**
 * @brief Enable peer certificate and host name verification
 */
ErrorCode configureTlsVerification(CURL* curl);

} // namespace Varsys::Network

#endif // VARSYS_NETWORK_TLS_CONTEXT_HPP
