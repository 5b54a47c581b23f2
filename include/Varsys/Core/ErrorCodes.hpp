/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Varsys license vault
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * This file defines all error codes used throughout Varsys, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef VARSYS_CORE_ERROR_CODES_HPP
#define VARSYS_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <type_traits>

namespace Varsys {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief High byte of an ErrorCode
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,
    System      = 0x01,  ///< Allocation and timing
    Crypto      = 0x03,  ///< OpenSSL primitives and certificates
    Network     = 0x04,  ///< libcurl transport and HTTP replies
    Config      = 0x08,  ///< Configuration file and settings
    IO          = 0x09,  ///< License, vault and log files
    Parse       = 0x0A,  ///< JSON, hex and base64 decoding
    License     = 0x0D,  ///< Activation and verification
    Vault       = 0x0E,  ///< Sealed configuration store
    Internal    = 0xFF   ///< Caller or programming errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Every failure a Varsys operation can report
 * 
 * The high byte is the ErrorCategory. Values are stable because they are
 * printed by varsysctl and appear in bug reports.
 */
enum class ErrorCode : uint16_t {
    Success = 0x0000,
    
    // System (0x01xx)
    AllocationFailed = 0x0102,
    Timeout = 0x0105,               ///< Network or lock wait exceeded its budget
    
    // Crypto (0x03xx)
    CryptoError = 0x0300,           ///< OpenSSL call failed without a better match
    EncryptionFailed = 0x0301,
    DecryptionFailed = 0x0302,      ///< AES-GCM tag mismatch or wrong key
    HashFailed = 0x0303,
    SignatureInvalid = 0x0305,      ///< Vault payload HMAC does not match
    InvalidKey = 0x0306,            ///< Empty secret, short key or bad key size
    RandomGenerationFailed = 0x0307,
    KeyDerivationFailed = 0x0308,
    CertificateInvalid = 0x0309,    ///< Authority TLS certificate rejected
    
    // Network (0x04xx)
    NetworkError = 0x0400,
    ConnectionFailed = 0x0401,
    ConnectionReset = 0x0402,
    DnsResolutionFailed = 0x0403,
    TlsHandshakeFailed = 0x0404,
    HttpResponseInvalid = 0x0407,   ///< Authority reply is not the expected JSON
    NetworkUnreachable = 0x040A,
    CurlInitFailed = 0x040C,
    
    // Config (0x08xx)
    ConfigInvalid = 0x0802,         ///< Wrong type or out-of-range value
    ConfigParseFailed = 0x0804,     ///< Line is not "key = value"
    
    // IO (0x09xx)
    IOError = 0x0900,
    FileNotFound = 0x0901,
    FileAccessDenied = 0x0902,      ///< Permission or symlink refusal
    DirectoryNotFound = 0x0904,
    DiskFull = 0x0905,
    FileReadError = 0x0906,
    FileWriteError = 0x0907,
    FileTooLarge = 0x0909,
    InvalidPath = 0x090A,
    AccessDenied = 0x090B,          ///< Path escapes the allowed directory
    
    // Parse (0x0Axx)
    JsonParseFailed = 0x0A01,
    JsonInvalid = 0x0A02,           ///< Well-formed JSON of the wrong shape, or unencodable text
    MissingField = 0x0A03,
    InvalidFieldType = 0x0A04,
    InvalidHexString = 0x0A05,
    InvalidBase64 = 0x0A06,
    
    // License (0x0Dxx)
    InvalidLicenseFormat = 0x0D01,  ///< Key failed the local format check
    ServerRejected = 0x0D02,        ///< Authority declined activation or re-validation
    LicenseNotFound = 0x0D03,
    LicenseExpired = 0x0D04,
    MachineMismatch = 0x0D05,       ///< Record or payload bound to another fingerprint
    LicenseTampered = 0x0D06,       ///< License file fails decryption or signature
    LicenseRequired = 0x0D07,       ///< Feature not granted by a valid license
    AuthorityUnreachable = 0x0D08,
    
    // Vault (0x0Exx)
    VaultMissing = 0x0E01,          ///< Vault or checksum file absent
    OuterTamperDetected = 0x0E02,   ///< Detached checksum or record structure
    InnerTamperDetected = 0x0E03,   ///< Integrity hash or payload structure
    
    // Internal (0xFFxx)
    InternalError = 0xFF00,
    InvalidState = 0xFF03,
    NullPointer = 0xFF04,
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 * @param code The error code
 * @return true if success, false otherwise
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 * @param code The error code
 * @return true if failure, false otherwise
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief A persisted license or vault file no longer authenticates
 */
[[nodiscard]] constexpr bool isTamperError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::LicenseTampered:
        case ErrorCode::OuterTamperDetected:
        case ErrorCode::InnerTamperDetected:
        case ErrorCode::SignatureInvalid:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get symbolic error code name (e.g. "MachineMismatch")
 * @param code The error code
 * @return Error code name
 */
[[nodiscard]] std::string_view getErrorName(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 * 
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 * 
 * @tparam T The success value type
 * 
 * @example
 * ```cpp
 * Result<LicenseRecord> record = store.verify();
 * if (record.isSuccess()) {
 *     use(record.value());
 * } else {
 *     report(getErrorMessage(record.error()));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}
    
    /// Construct from success value
    Result(const T& value) : m_data(value) {}
    
    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}
    
    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}
    
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    
    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }
    
    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }
    
    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }
    
    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }
    
    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }
    
    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }
    
    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }
    
    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }
    
    /// Get value or default if failure (move)
    [[nodiscard]] T valueOr(T&& defaultValue) && {
        return isSuccess() ? std::get<T>(std::move(m_data)) : std::move(defaultValue);
    }
    
    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }
    
    /// Transform success value using a function
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return Result<U>(func(std::get<T>(m_data)));
        }
        return Result<U>(std::get<ErrorCode>(m_data));
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 * 
 * Used for operations that can fail but don't return a value.
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}
    
    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}
    
    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }
    
    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }
    
    /// Explicit conversion to bool
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }
    
    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }
    
    /// Get error or the given default on success
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? m_error : defaultError;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 * 
 * Usage:
 * ```cpp
 * VARSYS_TRY(someOperation());
 * ```
 */
#define VARSYS_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 * 
 * Usage:
 * ```cpp
 * VARSYS_TRY_ASSIGN(value, someOperation());
 * ```
 */
#define VARSYS_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Varsys

#endif // VARSYS_CORE_ERROR_CODES_HPP
