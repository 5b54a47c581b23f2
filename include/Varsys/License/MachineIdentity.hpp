/**
 * @file MachineIdentity.hpp
 * @brief Device-bound machine fingerprint
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_LICENSE_MACHINE_IDENTITY_HPP
#define VARSYS_LICENSE_MACHINE_IDENTITY_HPP

#include <Varsys/Core/Types.hpp>

#include <string>

namespace Varsys::License {

/// Length of a fingerprint in hex characters
constexpr size_t FINGERPRINT_LENGTH = 32;

/// Host name used when the system reports none
constexpr const char* UNKNOWN_HOST = "unknown-host";

/**
 * @brief Raw identifiers a fingerprint is computed from
 * 
 * Empty strings mean "unavailable".
 */
struct MachineTraits {
    std::string platform;         ///< uname sysname, release and machine
    std::string processor;        ///< CPU model name
    std::string hostname;         ///< gethostname()
    std::string hardwareAddress;  ///< MAC of the first non-loopback interface
};

/**
 * @brief Fingerprint plus the platform string sent to the license authority
 */
struct MachineBinding {
    std::string fingerprint;
    std::string platform;
};

/**
 * @brief Derives the fingerprint that binds licenses and vaults to a device
 * 
 * The fingerprint is the first 32 hex characters of SHA-256 over a JSON
 * object of the traits with sorted keys. It is deterministic for a given
 * machine and never touches the network.
 * 
 * collect() is virtual so embedders and tests can supply fixed traits.
 * 
 * @example
 * ```cpp
 * MachineIdentity identity;
 * std::string fp = identity.fingerprint();
 * ```
 */
class MachineIdentity {
public:
    MachineIdentity() = default;
    virtual ~MachineIdentity() = default;
    
    /**
     * @brief Gather identifiers from the running system
     */
    virtual MachineTraits collect() const;
    
    /**
     * @brief Fingerprint of this machine; never throws
     */
    std::string fingerprint() const noexcept;
    
    /**
     * @brief Fingerprint and platform from a single trait collection
     */
    MachineBinding binding() const noexcept;
    
    /**
     * @brief Fingerprint for a given set of traits
     * 
     * If platform, processor or hostname is missing, only the hostname is
     * hashed (UNKNOWN_HOST when that is missing too). A missing hardware
     * address alone does not trigger the fallback.
     */
    static std::string fingerprintFrom(const MachineTraits& traits) noexcept;
};

/**
 * @brief MachineIdentity returning fixed traits
 */
class StaticMachineIdentity : public MachineIdentity {
public:
    explicit StaticMachineIdentity(MachineTraits traits) : m_traits(std::move(traits)) {}
    
    MachineTraits collect() const override { return m_traits; }

private:
    MachineTraits m_traits;
};

} // namespace Varsys::License

#endif // VARSYS_LICENSE_MACHINE_IDENTITY_HPP
