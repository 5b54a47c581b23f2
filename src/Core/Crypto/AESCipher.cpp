/**
 * @file AESCipher.cpp
 * @brief AES-256-GCM authenticated encryption using the OpenSSL EVP API
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * - 256-bit key (32 bytes), derived per machine by KeyDerivation
 * - 96-bit nonce (12 bytes), fresh from SecureRandom on every encrypt
 * - 128-bit authentication tag (16 bytes), appended to the ciphertext
 * - Optional additional authenticated data
 * 
 * Tag verification happens in EVP_DecryptFinal_ex. A failed tag returns
 * DecryptionFailed and the partially decrypted buffer is wiped.
 */

#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace Varsys::Crypto {

namespace {

constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;

} // namespace

// ============================================================================
// AESCipher::Impl
// ============================================================================

class AESCipher::Impl {
public:
    explicit Impl(const AESKey& key)
        : m_key(key)
    {
    }
    
    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }
    
    Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan associatedData) {
        auto nonce = m_rng.generateNonce();
        if (nonce.isFailure()) {
            return nonce.error();
        }
        
        auto sealed = encryptWithNonce(plaintext, nonce.value(), associatedData);
        if (sealed.isFailure()) {
            return sealed.error();
        }
        
        ByteBuffer output;
        output.reserve(NONCE_SIZE + sealed.value().size());
        output.insert(output.end(), nonce.value().begin(), nonce.value().end());
        output.insert(output.end(), sealed.value().begin(), sealed.value().end());
        return output;
    }
    
    Result<ByteBuffer> decrypt(ByteSpan ciphertext, ByteSpan associatedData) {
        if (ciphertext.size() < NONCE_SIZE + TAG_SIZE) {
            return ErrorCode::DecryptionFailed;
        }
        
        AESNonce nonce;
        std::copy_n(ciphertext.begin(), NONCE_SIZE, nonce.begin());
        
        return decryptWithNonce(ciphertext.subspan(NONCE_SIZE), nonce, associatedData);
    }
    
    Result<ByteBuffer> encryptWithNonce(
        ByteSpan plaintext,
        const AESNonce& nonce,
        ByteSpan associatedData
    ) {
        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::AllocationFailed;
        }
        
        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce.data()) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        
        int len = 0;
        if (!associatedData.empty()) {
            if (EVP_EncryptUpdate(ctx, nullptr, &len, associatedData.data(),
                                  static_cast<int>(associatedData.size())) != 1) {
                return ErrorCode::EncryptionFailed;
            }
        }
        
        ByteBuffer output(plaintext.size() + TAG_SIZE);
        int written = 0;
        
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx, output.data(), &len, plaintext.data(),
                                  static_cast<int>(plaintext.size())) != 1) {
                return ErrorCode::EncryptionFailed;
            }
            written = len;
        }
        
        if (EVP_EncryptFinal_ex(ctx, output.data() + written, &len) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        written += len;
        
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                                output.data() + written) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        
        output.resize(static_cast<size_t>(written) + TAG_SIZE);
        return output;
    }
    
    Result<ByteBuffer> decryptWithNonce(
        ByteSpan ciphertext,
        const AESNonce& nonce,
        ByteSpan associatedData
    ) {
        if (ciphertext.size() < TAG_SIZE) {
            return ErrorCode::DecryptionFailed;
        }
        
        const size_t bodySize = ciphertext.size() - TAG_SIZE;
        ByteSpan body = ciphertext.first(bodySize);
        AESTag tag;
        std::copy_n(ciphertext.begin() + static_cast<std::ptrdiff_t>(bodySize),
                    TAG_SIZE, tag.begin());
        
        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::AllocationFailed;
        }
        
        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce.data()) != 1) {
            return ErrorCode::DecryptionFailed;
        }
        
        int len = 0;
        if (!associatedData.empty()) {
            if (EVP_DecryptUpdate(ctx, nullptr, &len, associatedData.data(),
                                  static_cast<int>(associatedData.size())) != 1) {
                return ErrorCode::DecryptionFailed;
            }
        }
        
        ByteBuffer output(bodySize);
        int written = 0;
        
        if (bodySize > 0) {
            if (EVP_DecryptUpdate(ctx, output.data(), &len, body.data(),
                                  static_cast<int>(bodySize)) != 1) {
                secureZero(output.data(), output.size());
                return ErrorCode::DecryptionFailed;
            }
            written = len;
        }
        
        // Expected tag must be set before EVP_DecryptFinal_ex
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                                tag.data()) != 1) {
            secureZero(output.data(), output.size());
            return ErrorCode::DecryptionFailed;
        }
        
        if (EVP_DecryptFinal_ex(ctx, output.data() + written, &len) != 1) {
            secureZero(output.data(), output.size());
            return ErrorCode::DecryptionFailed;
        }
        written += len;
        
        output.resize(static_cast<size_t>(written));
        return output;
    }

private:
    AESKey m_key;
    SecureRandom m_rng;
};

// ============================================================================
// AESCipher - Public API
// ============================================================================

AESCipher::AESCipher(const AESKey& key)
    : m_impl(std::make_unique<Impl>(key)) {
}

AESCipher::~AESCipher() = default;

Result<ByteBuffer> AESCipher::encrypt(ByteSpan plaintext, ByteSpan associatedData) {
    return m_impl->encrypt(plaintext, associatedData);
}

Result<ByteBuffer> AESCipher::decrypt(ByteSpan ciphertext, ByteSpan associatedData) {
    return m_impl->decrypt(ciphertext, associatedData);
}

Result<ByteBuffer> AESCipher::encryptWithNonce(
    ByteSpan plaintext,
    const AESNonce& nonce,
    ByteSpan associatedData
) {
    return m_impl->encryptWithNonce(plaintext, nonce, associatedData);
}

Result<ByteBuffer> AESCipher::decryptWithNonce(
    ByteSpan ciphertext,
    const AESNonce& nonce,
    ByteSpan associatedData
) {
    return m_impl->decryptWithNonce(ciphertext, nonce, associatedData);
}

} // namespace Varsys::Crypto
