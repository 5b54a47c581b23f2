/**
 * @file HMAC.cpp
 * @brief HMAC via the OpenSSL 3 EVP_MAC interface
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Signs license records (keyed by the application secret) and vault
 * payloads (keyed by the vault secret). Verification is constant time.
 */

#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace Varsys::Crypto {

// ============================================================================
// HMAC::Impl
// ============================================================================

class HMAC::Impl {
public:
    Impl(ByteSpan key, HashAlgorithm algorithm)
        : m_key(key.begin(), key.end())
        , m_digestName(algorithm == HashAlgorithm::SHA512 ? "SHA512" : "SHA256")
    {
    }
    
    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }
    
    Result<ByteBuffer> compute(ByteSpan data) {
        // HMAC accepts an empty key; OpenSSL rejects a null key pointer
        static const Byte emptyKey = 0;
        const Byte* keyPtr = m_key.empty() ? &emptyKey : m_key.data();
        
        EVPMACPtr mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
        if (!mac) {
            return ErrorCode::CryptoError;
        }
        EVPMACCtxPtr ctx(EVP_MAC_CTX_new(mac));
        if (!ctx) {
            return ErrorCode::AllocationFailed;
        }
        
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST,
                                             const_cast<char*>(m_digestName), 0),
            OSSL_PARAM_construct_end()
        };
        
        if (EVP_MAC_init(ctx, keyPtr, m_key.size(), params) != 1) {
            return ErrorCode::InvalidKey;
        }
        if (!data.empty() && EVP_MAC_update(ctx, data.data(), data.size()) != 1) {
            return ErrorCode::CryptoError;
        }
        
        ByteBuffer out(EVP_MAX_MD_SIZE);
        size_t outLen = 0;
        if (EVP_MAC_final(ctx, out.data(), &outLen, out.size()) != 1) {
            return ErrorCode::CryptoError;
        }
        out.resize(outLen);
        return out;
    }

private:
    ByteBuffer m_key;
    const char* m_digestName;
};

// ============================================================================
// HMAC - Public API
// ============================================================================

HMAC::HMAC(ByteSpan key, HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(key, algorithm)) {
}

HMAC::~HMAC() = default;

Result<ByteBuffer> HMAC::compute(ByteSpan data) {
    return m_impl->compute(data);
}

Result<bool> HMAC::verify(ByteSpan data, ByteSpan mac) {
    auto computed = m_impl->compute(data);
    if (computed.isFailure()) {
        return computed.error();
    }
    return constantTimeCompare(computed.value(), mac);
}

Result<ByteBuffer> HMAC::sha256(ByteSpan key, ByteSpan data) {
    HMAC hmac(key, HashAlgorithm::SHA256);
    return hmac.compute(data);
}

Result<std::string> HMAC::sha256Hex(std::string_view key, std::string_view data) {
    auto mac = sha256(asBytes(key), asBytes(data));
    if (mac.isFailure()) {
        return mac.error();
    }
    return toHex(mac.value());
}

} // namespace Varsys::Crypto
