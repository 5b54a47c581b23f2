/**
 * @file VaultService.hpp
 * @brief Composition root for the license-gated vault
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#pragma once

#ifndef VARSYS_VAULT_VAULT_SERVICE_HPP
#define VARSYS_VAULT_VAULT_SERVICE_HPP

#include <Varsys/Core/Config.hpp>
#include <Varsys/Audit/AccessLog.hpp>
#include <Varsys/License/AccessGate.hpp>
#include <Varsys/License/LicenseAuthority.hpp>
#include <Varsys/License/LicenseStore.hpp>
#include <Varsys/License/MachineIdentity.hpp>
#include <Varsys/Vault/SecretVault.hpp>

#include <memory>

namespace Varsys::Vault {

/**
 * @brief Owns every component, wired once at startup
 * 
 * The machine fingerprint is computed once here and shared by the license
 * store, the vault and the access log. When Settings::authorityUrl is empty
 * an InMemoryLicenseAuthority is used.
 */
class VaultService {
public:
    /**
     * @brief Wire the components
     * 
     * @param settings Resolved settings (secrets already applied)
     * @param identity Source of the machine fingerprint
     * @param authority License authority, or nullptr to choose from settings
     * @param clock Wall clock for license and vault timestamps
     * @return Service, or an error if the data directory cannot be created
     */
    static Result<std::unique_ptr<VaultService>> create(
        Config::Settings settings,
        const License::MachineIdentity& identity,
        std::shared_ptr<License::LicenseAuthority> authority = nullptr,
        TimeSource clock = unixNow);
    
    ~VaultService();
    
    VaultService(const VaultService&) = delete;
    VaultService& operator=(const VaultService&) = delete;
    
    const Config::Settings& settings() const noexcept { return m_settings; }
    const std::string& machineFingerprint() const noexcept { return m_machine.fingerprint; }
    
    License::LicenseStore& licenses() noexcept { return *m_licenses; }
    License::AccessGate& gate() noexcept { return *m_gate; }
    SecretVault& vault() noexcept { return *m_vault; }
    Audit::AccessLog& auditLog() noexcept { return *m_accessLog; }
    License::LicenseAuthority& authority() noexcept { return *m_authority; }

private:
    VaultService(Config::Settings settings,
                 License::MachineBinding machine,
                 std::shared_ptr<License::LicenseAuthority> authority,
                 TimeSource clock);
    
    Config::Settings m_settings;
    License::MachineBinding m_machine;
    std::shared_ptr<License::LicenseAuthority> m_authority;
    std::unique_ptr<Audit::AccessLog> m_accessLog;
    std::unique_ptr<License::LicenseStore> m_licenses;
    std::unique_ptr<License::AccessGate> m_gate;
    std::unique_ptr<SecretVault> m_vault;
};

} // namespace Varsys::Vault

#endif // VARSYS_VAULT_VAULT_SERVICE_HPP
