/**
 * @file LicenseRecord.hpp
 * @brief License record and its signed, encrypted on-disk form
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_LICENSE_LICENSE_RECORD_HPP
#define VARSYS_LICENSE_LICENSE_RECORD_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>

#include <set>
#include <string>

namespace Varsys::License {

/// Feature that implies every other feature
constexpr const char* FEATURE_FULL_ACCESS = "full_access";

/**
 * @brief A license activated on this machine
 * 
 * Timestamps are Unix seconds (UTC). `signature` is HMAC-SHA256 under the
 * application secret over canonicalJson(), hex encoded.
 */
struct LicenseRecord {
    std::string user_id;
    std::string email;
    std::string license_key;
    std::string machine_fingerprint;
    std::string license_type;
    std::set<std::string> features;
    UnixTime activated_at = 0;
    UnixTime expires_at = 0;
    UnixTime last_online_check = 0;
    std::string signature;
    
    /**
     * @brief Serialization of every field except the signature, sorted keys
     */
    std::string canonicalJson() const;
    
    /**
     * @brief Serialization including the signature
     */
    std::string toJson() const;
    
    /**
     * @brief Parse a record produced by toJson()
     * @return Record, JsonParseFailed, MissingField or InvalidFieldType
     */
    static Result<LicenseRecord> fromJson(std::string_view text);
    
    /**
     * @brief Whether the feature, or full_access, was issued
     */
    bool grants(std::string_view feature) const;
    
    bool isExpired(UnixTime now) const { return now > expires_at; }
};

/**
 * @brief Compute the record signature
 */
Result<std::string> signRecord(const LicenseRecord& record, std::string_view appSecret);

/**
 * @brief Recompute and compare the signature in constant time
 */
bool verifyRecordSignature(const LicenseRecord& record, std::string_view appSecret);

/**
 * @brief Encrypt the record for license.dat
 * 
 * base64(AES-256-GCM(toJson())) under the license key derived from the
 * application secret and the fingerprint.
 */
Result<std::string> sealRecord(const LicenseRecord& record,
                               std::string_view appSecret,
                               std::string_view fingerprint);

/**
 * @brief Reverse sealRecord()
 * 
 * @return Record, or LicenseTampered when the text does not decode,
 *         decrypt or parse (the signature is not checked here)
 */
Result<LicenseRecord> openRecord(std::string_view sealed,
                                 std::string_view appSecret,
                                 std::string_view fingerprint);

} // namespace Varsys::License

#endif // VARSYS_LICENSE_LICENSE_RECORD_HPP
