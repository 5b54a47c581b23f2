/**
 * @file Types.hpp
 * @brief Core type definitions for the Varsys license vault
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Fundamental type aliases, constants and cryptographic container types
 * shared by every Varsys component.
 */

#pragma once

#ifndef VARSYS_CORE_TYPES_HPP
#define VARSYS_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>

namespace Varsys {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 2;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string, reported to the license authority as app_version
constexpr const char* VERSION_STRING = "2.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/**
 * @brief View the characters of a string as bytes
 * @param str Source string (must outlive the returned span)
 * @return Byte view over the string contents
 */
inline ByteSpan asBytes(std::string_view str) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(str.data()), str.size());
}

// ============================================================================
// Time Types
// ============================================================================

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Duration in seconds
using Seconds = std::chrono::seconds;

/// Wall clock used for license and vault timestamps
using SystemClock = std::chrono::system_clock;

/// Seconds since the Unix epoch (UTC)
using UnixTime = int64_t;

/**
 * @brief Source of wall-clock time
 *
 * Injected into LicenseStore and SecretVault so expiry and re-validation
 * windows can be exercised without waiting for real time to pass.
 */
using TimeSource = std::function<UnixTime()>;

/**
 * @brief Current wall-clock time in Unix seconds
 */
inline UnixTime unixNow() {
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

/// Number of seconds in a day
constexpr UnixTime SECONDS_PER_DAY = 86400;

// ============================================================================
// Hash Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

/// SHA-512 hash (64 bytes)
using SHA512Hash = std::array<Byte, 64>;

// ============================================================================
// Cryptographic Types
// ============================================================================

/// AES-256 key (32 bytes)
using AESKey = std::array<Byte, 32>;

/// AES IV/Nonce (12 bytes for GCM)
using AESNonce = std::array<Byte, 12>;

/// AES-GCM authentication tag (16 bytes)
using AESTag = std::array<Byte, 16>;

// ============================================================================
// Callback Types
// ============================================================================

/// Callback for logging
using LogCallback = std::function<void(int level, const std::string& message)>;

} // namespace Varsys

#endif // VARSYS_CORE_TYPES_HPP
