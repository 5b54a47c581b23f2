/**
 * @file KeyDerivation.hpp
 * @brief Password-based key derivation for license and vault keys
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Keys are PBKDF2-HMAC-SHA256 over master_secret || fingerprint || context
 * with a fixed application salt. The machine fingerprint in the input is
 * what ties an encrypted record to the machine it was written on.
 */

#pragma once

#ifndef VARSYS_CORE_KEY_DERIVATION_HPP
#define VARSYS_CORE_KEY_DERIVATION_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace Varsys::Crypto {

/**
 * @brief PBKDF2 parameter set
 */
struct KdfParameters {
    std::string salt;            ///< Fixed application-wide salt
    uint32_t iterations = 0;     ///< PBKDF2 iteration count
};

/**
 * @brief Parameters for the license file key (100,000 iterations)
 */
[[nodiscard]] const KdfParameters& licenseKdfParameters() noexcept;

/**
 * @brief Parameters for the vault key (200,000 iterations)
 * 
 * The vault holds the higher-value secret and always uses the stronger set.
 */
[[nodiscard]] const KdfParameters& vaultKdfParameters() noexcept;

/// Minimum iteration count accepted by deriveKey()
constexpr uint32_t MIN_KDF_ITERATIONS = 100000;

/// Context tag for the vault key
constexpr const char* VAULT_KEY_CONTEXT = "firebase_store";

/**
 * @brief Raw PBKDF2-HMAC-SHA256
 * @param password Password bytes
 * @param salt Salt bytes
 * @param iterations Iteration count (must be > 0)
 * @return 32-byte key or KeyDerivationFailed
 */
Result<AESKey> pbkdf2Sha256(ByteSpan password, ByteSpan salt, uint32_t iterations);

/**
 * @brief Derive a 32-byte symmetric key bound to a machine
 * 
 * @param masterSecret Application or vault master secret
 * @param fingerprint Machine fingerprint
 * @param context Purpose tag (empty for the license key)
 * @param params Salt and iteration count
 * @return Derived key, InvalidArgument for an empty secret or an
 *         iteration count below MIN_KDF_ITERATIONS, or KeyDerivationFailed
 */
Result<AESKey> deriveKey(std::string_view masterSecret,
                         std::string_view fingerprint,
                         std::string_view context,
                         const KdfParameters& params);

} // namespace Varsys::Crypto

#endif // VARSYS_CORE_KEY_DERIVATION_HPP
