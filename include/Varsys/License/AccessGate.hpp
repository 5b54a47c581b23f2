/**
 * @file AccessGate.hpp
 * @brief Feature gate over the license store
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_LICENSE_ACCESS_GATE_HPP
#define VARSYS_LICENSE_ACCESS_GATE_HPP

#include <Varsys/Core/ErrorCodes.hpp>
#include <Varsys/License/LicenseRecord.hpp>

#include <string>
#include <string_view>

namespace Varsys::License {

class LicenseStore;
class AccessGate;

/**
 * @brief Proof that a feature was authorized against a verified license
 * 
 * Only AccessGate can create one. Operations that require a licensed
 * feature take the token by const reference.
 */
class AccessToken {
public:
    const LicenseRecord& license() const noexcept { return m_license; }
    const std::string& feature() const noexcept { return m_feature; }

private:
    friend class AccessGate;
    
    AccessToken(LicenseRecord license, std::string feature)
        : m_license(std::move(license))
        , m_feature(std::move(feature))
    {
    }
    
    LicenseRecord m_license;
    std::string m_feature;
};

/**
 * @brief Answers "is feature F licensed on this machine?"
 */
class AccessGate {
public:
    explicit AccessGate(LicenseStore& store) : m_store(store) {}
    
    /**
     * @brief Verified license grants the feature or full_access
     */
    bool isFeatureEnabled(std::string_view feature) noexcept;
    
    /**
     * @brief Authorize one use of a feature
     * @return Token, or LicenseRequired
     */
    Result<AccessToken> authorize(std::string_view feature);

private:
    LicenseStore& m_store;
};

} // namespace Varsys::License

#endif // VARSYS_LICENSE_ACCESS_GATE_HPP
