/**
 * @file OpenSSLRAII.hpp
 * @brief RAII wrappers for OpenSSL contexts
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Every EVP context acquired by the crypto module is owned by one of these
 * wrappers so early returns on error paths cannot leak it.
 * 
 * @code
 * EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
 * @endcode
 */

#pragma once

#ifndef VARSYS_CRYPTO_OPENSSL_RAII_HPP
#define VARSYS_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <utility>

namespace Varsys::Crypto {

/**
 * @brief Unique-ownership wrapper for an OpenSSL object
 * 
 * @tparam T OpenSSL object type (e.g. EVP_CIPHER_CTX)
 * @tparam Deleter OpenSSL free function for T
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLRAII {
public:
    explicit OpenSSLRAII(T* ptr = nullptr) noexcept
        : m_ptr(ptr) {
    }
    
    ~OpenSSLRAII() noexcept {
        reset();
    }
    
    OpenSSLRAII(const OpenSSLRAII&) = delete;
    OpenSSLRAII& operator=(const OpenSSLRAII&) = delete;
    
    OpenSSLRAII(OpenSSLRAII&& other) noexcept
        : m_ptr(other.m_ptr) {
        other.m_ptr = nullptr;
    }
    
    OpenSSLRAII& operator=(OpenSSLRAII&& other) noexcept {
        if (this != &other) {
            reset();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }
    
    /**
     * @brief Free the held object and take ownership of ptr
     */
    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }
    
    [[nodiscard]] T* get() const noexcept {
        return m_ptr;
    }
    
    [[nodiscard]] explicit operator bool() const noexcept {
        return m_ptr != nullptr;
    }
    
    /// Implicit conversion for passing straight into OpenSSL calls
    operator T*() const noexcept {
        return m_ptr;
    }

private:
    T* m_ptr;
};

/// Symmetric cipher context (AES-GCM)
using EVPCipherCtxPtr = OpenSSLRAII<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;

/// Message digest context
using EVPMDCtxPtr = OpenSSLRAII<EVP_MD_CTX, EVP_MD_CTX_free>;

/// MAC algorithm handle (EVP_MAC_fetch)
using EVPMACPtr = OpenSSLRAII<EVP_MAC, EVP_MAC_free>;

/// MAC context
using EVPMACCtxPtr = OpenSSLRAII<EVP_MAC_CTX, EVP_MAC_CTX_free>;

/// BIO chain (freed with BIO_free_all)
using BIOChainPtr = OpenSSLRAII<BIO, BIO_free_all>;

} // namespace Varsys::Crypto

#endif // VARSYS_CRYPTO_OPENSSL_RAII_HPP
