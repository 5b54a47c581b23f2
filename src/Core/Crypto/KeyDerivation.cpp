/**
 * @file KeyDerivation.cpp
 * @brief PBKDF2-HMAC-SHA256 key derivation
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/KeyDerivation.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <openssl/evp.h>
#include <limits>

namespace Varsys::Crypto {

const KdfParameters& licenseKdfParameters() noexcept {
    static const KdfParameters params{"varsys_kitchen_salt_2025", 100000};
    return params;
}

const KdfParameters& vaultKdfParameters() noexcept {
    static const KdfParameters params{"varsys_firebase_vault_salt_2025_secure", 200000};
    return params;
}

Result<AESKey> pbkdf2Sha256(ByteSpan password, ByteSpan salt, uint32_t iterations) {
    if (iterations == 0 ||
        iterations > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        password.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        salt.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return ErrorCode::InvalidArgument;
    }
    
    AESKey key{};
    int ok = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<const char*>(password.data()),
        static_cast<int>(password.size()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(key.size()),
        key.data()
    );
    
    if (ok != 1) {
        secureZero(key.data(), key.size());
        return ErrorCode::KeyDerivationFailed;
    }
    return key;
}

Result<AESKey> deriveKey(std::string_view masterSecret,
                         std::string_view fingerprint,
                         std::string_view context,
                         const KdfParameters& params) {
    if (masterSecret.empty() || params.salt.empty() ||
        params.iterations < MIN_KDF_ITERATIONS) {
        return ErrorCode::InvalidArgument;
    }
    
    std::string material;
    material.reserve(masterSecret.size() + fingerprint.size() + context.size());
    material.append(masterSecret);
    material.append(fingerprint);
    material.append(context);
    
    auto key = pbkdf2Sha256(asBytes(material), asBytes(params.salt), params.iterations);
    secureZero(material.data(), material.size());
    return key;
}

} // namespace Varsys::Crypto
