/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Varsys error codes
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/ErrorCodes.hpp>

namespace Varsys {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:               return "Success";
        case ErrorCode::AllocationFailed:      return "Memory allocation failed";
        case ErrorCode::Timeout:               return "Operation timed out";
        case ErrorCode::CryptoError:           return "Cryptographic error";
        case ErrorCode::EncryptionFailed:      return "Encryption failed";
        case ErrorCode::DecryptionFailed:      return "Decryption failed";
        case ErrorCode::HashFailed:            return "Hash computation failed";
        case ErrorCode::SignatureInvalid:      return "Signature verification failed";
        case ErrorCode::InvalidKey:            return "Invalid key";
        case ErrorCode::RandomGenerationFailed:return "Random number generation failed";
        case ErrorCode::KeyDerivationFailed:   return "Key derivation failed";
        case ErrorCode::CertificateInvalid:    return "Certificate validation failed";
        case ErrorCode::NetworkError:          return "Network error";
        case ErrorCode::ConnectionFailed:      return "Connection failed";
        case ErrorCode::ConnectionReset:       return "Connection reset";
        case ErrorCode::DnsResolutionFailed:   return "DNS resolution failed";
        case ErrorCode::TlsHandshakeFailed:    return "TLS handshake failed";
        case ErrorCode::HttpResponseInvalid:   return "Invalid HTTP response";
        case ErrorCode::NetworkUnreachable:    return "Network unreachable";
        case ErrorCode::CurlInitFailed:        return "cURL initialization failed";
        case ErrorCode::ConfigInvalid:         return "Invalid configuration value";
        case ErrorCode::ConfigParseFailed:     return "Configuration parse error";
        case ErrorCode::IOError:               return "I/O error";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileAccessDenied:      return "File access denied";
        case ErrorCode::DirectoryNotFound:     return "Directory not found";
        case ErrorCode::DiskFull:              return "Disk full";
        case ErrorCode::FileReadError:         return "File read error";
        case ErrorCode::FileWriteError:        return "File write error";
        case ErrorCode::FileTooLarge:          return "File too large";
        case ErrorCode::InvalidPath:           return "Invalid file path";
        case ErrorCode::AccessDenied:          return "Access denied";
        case ErrorCode::JsonParseFailed:       return "JSON parse error";
        case ErrorCode::JsonInvalid:           return "Invalid JSON structure";
        case ErrorCode::MissingField:          return "Missing required field";
        case ErrorCode::InvalidFieldType:      return "Invalid field type";
        case ErrorCode::InvalidHexString:      return "Invalid hex string";
        case ErrorCode::InvalidBase64:         return "Invalid base64 string";
        case ErrorCode::InvalidLicenseFormat:  return "Invalid license key format";
        case ErrorCode::ServerRejected:        return "License authority rejected the request";
        case ErrorCode::LicenseNotFound:       return "No license activated";
        case ErrorCode::LicenseExpired:        return "License expired";
        case ErrorCode::MachineMismatch:       return "License is bound to a different machine";
        case ErrorCode::LicenseTampered:       return "License file tampered";
        case ErrorCode::LicenseRequired:       return "Valid license required";
        case ErrorCode::AuthorityUnreachable:  return "License authority unreachable";
        case ErrorCode::VaultMissing:          return "Vault not found";
        case ErrorCode::OuterTamperDetected:   return "Vault checksum mismatch";
        case ErrorCode::InnerTamperDetected:   return "Vault integrity hash mismatch";
        case ErrorCode::InternalError:         return "Internal error";
        case ErrorCode::InvalidState:          return "Invalid state";
        case ErrorCode::NullPointer:           return "Null pointer";
        case ErrorCode::InvalidArgument:       return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getErrorName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:               return "Success";
        case ErrorCode::AllocationFailed:      return "AllocationFailed";
        case ErrorCode::Timeout:               return "Timeout";
        case ErrorCode::CryptoError:           return "CryptoError";
        case ErrorCode::EncryptionFailed:      return "EncryptionFailed";
        case ErrorCode::DecryptionFailed:      return "DecryptionFailed";
        case ErrorCode::HashFailed:            return "HashFailed";
        case ErrorCode::SignatureInvalid:      return "SignatureInvalid";
        case ErrorCode::InvalidKey:            return "InvalidKey";
        case ErrorCode::RandomGenerationFailed:return "RandomGenerationFailed";
        case ErrorCode::KeyDerivationFailed:   return "KeyDerivationFailed";
        case ErrorCode::CertificateInvalid:    return "CertificateInvalid";
        case ErrorCode::NetworkError:          return "NetworkError";
        case ErrorCode::ConnectionFailed:      return "ConnectionFailed";
        case ErrorCode::ConnectionReset:       return "ConnectionReset";
        case ErrorCode::DnsResolutionFailed:   return "DnsResolutionFailed";
        case ErrorCode::TlsHandshakeFailed:    return "TlsHandshakeFailed";
        case ErrorCode::HttpResponseInvalid:   return "HttpResponseInvalid";
        case ErrorCode::NetworkUnreachable:    return "NetworkUnreachable";
        case ErrorCode::CurlInitFailed:        return "CurlInitFailed";
        case ErrorCode::ConfigInvalid:         return "ConfigInvalid";
        case ErrorCode::ConfigParseFailed:     return "ConfigParseFailed";
        case ErrorCode::IOError:               return "IOError";
        case ErrorCode::FileNotFound:          return "FileNotFound";
        case ErrorCode::FileAccessDenied:      return "FileAccessDenied";
        case ErrorCode::DirectoryNotFound:     return "DirectoryNotFound";
        case ErrorCode::DiskFull:              return "DiskFull";
        case ErrorCode::FileReadError:         return "FileReadError";
        case ErrorCode::FileWriteError:        return "FileWriteError";
        case ErrorCode::FileTooLarge:          return "FileTooLarge";
        case ErrorCode::InvalidPath:           return "InvalidPath";
        case ErrorCode::AccessDenied:          return "AccessDenied";
        case ErrorCode::JsonParseFailed:       return "JsonParseFailed";
        case ErrorCode::JsonInvalid:           return "JsonInvalid";
        case ErrorCode::MissingField:          return "MissingField";
        case ErrorCode::InvalidFieldType:      return "InvalidFieldType";
        case ErrorCode::InvalidHexString:      return "InvalidHexString";
        case ErrorCode::InvalidBase64:         return "InvalidBase64";
        case ErrorCode::InvalidLicenseFormat:  return "InvalidLicenseFormat";
        case ErrorCode::ServerRejected:        return "ServerRejected";
        case ErrorCode::LicenseNotFound:       return "LicenseNotFound";
        case ErrorCode::LicenseExpired:        return "LicenseExpired";
        case ErrorCode::MachineMismatch:       return "MachineMismatch";
        case ErrorCode::LicenseTampered:       return "LicenseTampered";
        case ErrorCode::LicenseRequired:       return "LicenseRequired";
        case ErrorCode::AuthorityUnreachable:  return "AuthorityUnreachable";
        case ErrorCode::VaultMissing:          return "VaultMissing";
        case ErrorCode::OuterTamperDetected:   return "OuterTamperDetected";
        case ErrorCode::InnerTamperDetected:   return "InnerTamperDetected";
        case ErrorCode::InternalError:         return "InternalError";
        case ErrorCode::InvalidState:          return "InvalidState";
        case ErrorCode::NullPointer:           return "NullPointer";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
    }
    return "Unknown";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:      return "None";
        case ErrorCategory::System:    return "System";
        case ErrorCategory::Crypto:    return "Crypto";
        case ErrorCategory::Network:   return "Network";
        case ErrorCategory::Config:    return "Config";
        case ErrorCategory::IO:        return "IO";
        case ErrorCategory::Parse:     return "Parse";
        case ErrorCategory::License:   return "License";
        case ErrorCategory::Vault:     return "Vault";
        case ErrorCategory::Internal:  return "Internal";
    }
    return "Unknown";
}

} // namespace Varsys
