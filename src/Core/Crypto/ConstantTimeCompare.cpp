/**
 * @file ConstantTimeCompare.cpp
 * @brief Constant-time comparison for signatures and checksums
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * License signatures, payload signatures and vault checksums are all
 * compared through these helpers so a mismatch position never shows up
 * in timing.
 */

#include <Varsys/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Varsys::Crypto {

bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    // Length is public (fixed-size MACs and digests)
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constantTimeCompare(std::string_view a, std::string_view b) noexcept {
    return constantTimeCompare(asBytes(a), asBytes(b));
}

} // namespace Varsys::Crypto
