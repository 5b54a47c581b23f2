/**
 * @file Crypto.hpp
 * @brief Cryptographic primitives for the Varsys license vault
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * This module provides the primitives license and vault records are built on:
 * - AES-256-GCM encryption/decryption
 * - SHA-256/SHA-512 hashing
 * - HMAC-SHA256 record signatures
 * - Secure random number generation
 * - Hex and base64 encoding
 */

#pragma once

#ifndef VARSYS_CORE_CRYPTO_HPP
#define VARSYS_CORE_CRYPTO_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace Varsys::Crypto {

// ============================================================================
// Secure Random Number Generator
// ============================================================================

/**
 * @brief Cryptographically secure random number generator
 * 
 * Reads from /dev/urandom. Used for GCM nonces and for the overwrite
 * pattern of secure file erasure.
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();
    
    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;
    
    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Buffer to fill with random bytes
     * @param size Number of bytes to generate
     * @return Result indicating success or failure
     */
    Result<void> generate(Byte* buffer, size_t size);
    
    /**
     * @brief Generate random byte buffer
     * @param size Number of bytes to generate
     * @return Random bytes or error
     */
    Result<ByteBuffer> generate(size_t size);
    
    /**
     * @brief Generate random AES nonce
     * @return Random 12-byte nonce or error
     */
    Result<AESNonce> generateNonce();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Hash Engine
// ============================================================================

/**
 * @brief Hash algorithm types
 */
enum class HashAlgorithm {
    SHA256,
    SHA512
};

/**
 * @brief Cryptographic hash engine
 * 
 * Provides one-shot and streaming hash computation.
 * 
 * @example
 * ```cpp
 * HashEngine hasher(HashAlgorithm::SHA512);
 * hasher.init();
 * hasher.update(plaintext);
 * hasher.update(asBytes(integrityKey));
 * auto digest = hasher.finalize();
 * ```
 */
class HashEngine {
public:
    /**
     * @brief Construct hash engine with algorithm
     * @param algorithm Hash algorithm to use
     */
    explicit HashEngine(HashAlgorithm algorithm = HashAlgorithm::SHA256);
    
    ~HashEngine();
    
    /**
     * @brief Compute hash of data (one-shot)
     * @param data Data to hash
     * @return Hash bytes or error
     */
    Result<ByteBuffer> hash(ByteSpan data);
    
    /**
     * @brief Compute SHA-256 hash
     * @param data Data to hash
     * @return SHA256Hash or error
     */
    static Result<SHA256Hash> sha256(ByteSpan data);
    
    /**
     * @brief Compute SHA-512 hash
     * @param data Data to hash
     * @return SHA512Hash or error
     */
    static Result<SHA512Hash> sha512(ByteSpan data);
    
    /**
     * @brief Initialize streaming hash
     * @return Result indicating success or failure
     */
    Result<void> init();
    
    /**
     * @brief Update hash with data
     * @param data Data to add
     * @return Result indicating success or failure
     */
    Result<void> update(ByteSpan data);
    
    /**
     * @brief Finalize and get hash
     * @return Hash bytes or error
     */
    Result<ByteBuffer> finalize();
    
    /**
     * @brief Get hash size for algorithm
     * @param algorithm Hash algorithm
     * @return Size in bytes
     */
    static size_t getHashSize(HashAlgorithm algorithm) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// AES Cipher
// ============================================================================

/**
 * @brief AES-256-GCM cipher for authenticated encryption
 * 
 * Output layout of encrypt(): nonce (12) || ciphertext || tag (16).
 * A fresh random nonce is drawn for every call; the license and vault
 * files are rewritten with a new nonce each time they are sealed.
 * 
 * @example
 * ```cpp
 * AESCipher cipher(derivedKey);
 * auto sealed = cipher.encrypt(plaintext, asBytes(context));
 * auto opened = cipher.decrypt(sealed.value(), asBytes(context));
 * ```
 */
class AESCipher {
public:
    /**
     * @brief Construct cipher with key
     * @param key AES-256 key (32 bytes)
     */
    explicit AESCipher(const AESKey& key);
    
    ~AESCipher();
    
    /**
     * @brief Encrypt data with AES-256-GCM
     * @param plaintext Data to encrypt
     * @param associatedData Additional authenticated data (optional)
     * @return Encrypted data (nonce + ciphertext + tag) or error
     */
    Result<ByteBuffer> encrypt(
        ByteSpan plaintext,
        ByteSpan associatedData = {}
    );
    
    /**
     * @brief Decrypt data with AES-256-GCM
     * 
     * Returns DecryptionFailed when the tag does not verify; no plaintext
     * is exposed in that case.
     * 
     * @param ciphertext Encrypted data (nonce + ciphertext + tag)
     * @param associatedData Additional authenticated data (optional)
     * @return Decrypted data or error
     */
    Result<ByteBuffer> decrypt(
        ByteSpan ciphertext,
        ByteSpan associatedData = {}
    );

private:
    /**
     * @brief Encrypt with explicit nonce
     * 
     * @warning Reusing a nonce under the same key breaks GCM. Only the
     * known-answer tests reach this through AESCipherTestAccessor.
     */
    Result<ByteBuffer> encryptWithNonce(
        ByteSpan plaintext,
        const AESNonce& nonce,
        ByteSpan associatedData = {}
    );
    
    Result<ByteBuffer> decryptWithNonce(
        ByteSpan ciphertext,
        const AESNonce& nonce,
        ByteSpan associatedData = {}
    );

    class Impl;
    std::unique_ptr<Impl> m_impl;
    
    // Defined in tests/Core/test_aes_cipher.cpp
    friend class AESCipherTestAccessor;
};

// ============================================================================
// HMAC
// ============================================================================

/**
 * @brief HMAC (Hash-based Message Authentication Code)
 */
class HMAC {
public:
    /**
     * @brief Construct HMAC with key
     * @param key HMAC key
     * @param algorithm Hash algorithm (default: SHA256)
     */
    explicit HMAC(ByteSpan key, HashAlgorithm algorithm = HashAlgorithm::SHA256);
    
    ~HMAC();
    
    /**
     * @brief Compute HMAC of data (one-shot)
     * @param data Data to authenticate
     * @return HMAC bytes or error
     */
    Result<ByteBuffer> compute(ByteSpan data);
    
    /**
     * @brief Compute HMAC-SHA256 (static helper)
     * @param key HMAC key
     * @param data Data to authenticate
     * @return HMAC bytes or error
     */
    static Result<ByteBuffer> sha256(ByteSpan key, ByteSpan data);
    
    /**
     * @brief Compute HMAC-SHA256 and hex-encode it
     * @param key HMAC key
     * @param data Data to authenticate
     * @return Lowercase hex MAC or error
     */
    static Result<std::string> sha256Hex(std::string_view key, std::string_view data);
    
    /**
     * @brief Verify HMAC in constant time
     * @param data Original data
     * @param mac HMAC to verify
     * @return true if valid, false if invalid
     */
    Result<bool> verify(ByteSpan data, ByteSpan mac);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 * @param data Bytes to convert
 * @return Hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Convert hex string to bytes
 * @param hex Hex string (either case)
 * @return Bytes or InvalidHexString
 */
Result<ByteBuffer> fromHex(std::string_view hex);

/**
 * @brief Convert bytes to base64 string (standard alphabet, padded, no newlines)
 * @param data Bytes to convert
 * @return Base64 string
 */
std::string toBase64(ByteSpan data);

/**
 * @brief Convert base64 string to bytes
 * 
 * Strict: rejects characters outside the standard alphabet, bad padding
 * and lengths that are not a multiple of four.
 * 
 * @param base64 Base64 string
 * @return Bytes or InvalidBase64
 */
Result<ByteBuffer> fromBase64(std::string_view base64);

/**
 * @brief Check that text is well-formed UTF-8
 * 
 * Overlong forms, surrogates and code points above U+10FFFF are rejected.
 */
bool isValidUtf8(std::string_view text) noexcept;

/**
 * @brief Constant-time comparison of byte arrays
 * 
 * For HMAC signatures and file checksums. AES-GCM tags are verified
 * inside EVP_DecryptFinal_ex and never compared by hand.
 * 
 * @param a First array
 * @param b Second array
 * @return true if equal
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

/**
 * @brief Constant-time comparison of two strings
 */
bool constantTimeCompare(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Securely zero memory
 * @param data Memory to zero
 * @param size Size of memory
 */
void secureZero(void* data, size_t size) noexcept;

} // namespace Varsys::Crypto

#endif // VARSYS_CORE_CRYPTO_HPP
