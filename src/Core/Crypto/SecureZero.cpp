/**
 * @file SecureZero.cpp
 * @brief Key material erasure
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Varsys::Crypto {

/**
 * @brief Overwrite a buffer with zeros in a way the optimizer cannot drop
 * 
 * Derived keys and secret copies are wiped with this before release.
 * OPENSSL_cleanse is used so the store cannot be elided as dead.
 */
void secureZero(void* data, size_t size) noexcept {
    if (data == nullptr || size == 0) {
        return;
    }
    OPENSSL_cleanse(data, size);
}

} // namespace Varsys::Crypto
