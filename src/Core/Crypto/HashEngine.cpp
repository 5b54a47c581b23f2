/**
 * @file HashEngine.cpp
 * @brief SHA-256/SHA-512 hashing using the OpenSSL EVP digest API
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * SHA-256 backs machine fingerprints and the detached vault checksum;
 * SHA-512 backs the vault's inner integrity hash.
 */

#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace Varsys::Crypto {

namespace {

const EVP_MD* selectDigest(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA512:
            return EVP_sha512();
        case HashAlgorithm::SHA256:
        default:
            return EVP_sha256();
    }
}

template<size_t N>
Result<std::array<Byte, N>> fixedDigest(HashAlgorithm algorithm, ByteSpan data) {
    HashEngine engine(algorithm);
    auto result = engine.hash(data);
    if (result.isFailure()) {
        return result.error();
    }
    
    const auto& bytes = result.value();
    if (bytes.size() != N) {
        return ErrorCode::HashFailed;
    }
    
    std::array<Byte, N> digest{};
    std::copy(bytes.begin(), bytes.end(), digest.begin());
    return digest;
}

} // namespace

// ============================================================================
// HashEngine::Impl
// ============================================================================

class HashEngine::Impl {
public:
    explicit Impl(HashAlgorithm algorithm)
        : m_ctx(EVP_MD_CTX_new())
        , m_md(selectDigest(algorithm))
    {
    }
    
    Result<void> init() {
        if (!m_ctx) {
            return ErrorCode::AllocationFailed;
        }
        if (EVP_DigestInit_ex(m_ctx, m_md, nullptr) != 1) {
            return ErrorCode::HashFailed;
        }
        m_active = true;
        return Result<void>();
    }
    
    Result<void> update(ByteSpan data) {
        if (!m_active) {
            return ErrorCode::InvalidState;
        }
        if (data.empty()) {
            return Result<void>();
        }
        if (EVP_DigestUpdate(m_ctx, data.data(), data.size()) != 1) {
            return ErrorCode::HashFailed;
        }
        return Result<void>();
    }
    
    Result<ByteBuffer> finalize() {
        if (!m_active) {
            return ErrorCode::InvalidState;
        }
        m_active = false;
        
        ByteBuffer digest(static_cast<size_t>(EVP_MD_get_size(m_md)));
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(m_ctx, digest.data(), &len) != 1) {
            return ErrorCode::HashFailed;
        }
        digest.resize(len);
        return digest;
    }

private:
    EVPMDCtxPtr m_ctx;
    const EVP_MD* m_md;
    bool m_active = false;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine(HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(algorithm)) {
}

HashEngine::~HashEngine() = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    VARSYS_TRY(m_impl->init());
    VARSYS_TRY(m_impl->update(data));
    return m_impl->finalize();
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    return fixedDigest<32>(HashAlgorithm::SHA256, data);
}

Result<SHA512Hash> HashEngine::sha512(ByteSpan data) {
    return fixedDigest<64>(HashAlgorithm::SHA512, data);
}

Result<void> HashEngine::init() {
    return m_impl->init();
}

Result<void> HashEngine::update(ByteSpan data) {
    return m_impl->update(data);
}

Result<ByteBuffer> HashEngine::finalize() {
    return m_impl->finalize();
}

size_t HashEngine::getHashSize(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return 32;
        case HashAlgorithm::SHA512:
            return 64;
    }
    return 0;
}

} // namespace Varsys::Crypto
