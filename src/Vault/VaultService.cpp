/**
 * @file VaultService.cpp
 * @brief Component wiring
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Vault/VaultService.hpp>
#include <Varsys/Core/FileStore.hpp>
#include <Varsys/Core/Logger.hpp>

namespace Varsys::Vault {

Result<std::unique_ptr<VaultService>> VaultService::create(
    Config::Settings settings,
    const License::MachineIdentity& identity,
    std::shared_ptr<License::LicenseAuthority> authority,
    TimeSource clock)
{
    VARSYS_TRY(IO::ensureDirectory(settings.dataDir));
    
    if (settings.usingDevelopmentSecrets) {
        VARSYS_LOG_WARNING("Development secrets in use; set VARSYS_APP_SECRET, "
                           "VARSYS_FIREBASE_SECRET and VARSYS_INTEGRITY_KEY for production");
    }
    
    if (!authority) {
        if (settings.authorityUrl.empty()) {
            VARSYS_LOG_INFO("No license server configured, using offline authority");
            authority = std::make_shared<License::InMemoryLicenseAuthority>(clock);
        } else {
            VARSYS_LOG_INFO_F("License server: %s", settings.authorityUrl.c_str());
            authority = std::make_shared<License::HttpLicenseAuthority>(
                settings.authorityUrl, settings.authorityTimeout);
        }
    }
    
    License::MachineBinding machine = identity.binding();
    VARSYS_LOG_DEBUG_F("Machine fingerprint %s", machine.fingerprint.c_str());
    
    return std::unique_ptr<VaultService>(new VaultService(
        std::move(settings), std::move(machine), std::move(authority), std::move(clock)));
}

VaultService::VaultService(Config::Settings settings,
                           License::MachineBinding machine,
                           std::shared_ptr<License::LicenseAuthority> authority,
                           TimeSource clock)
    : m_settings(std::move(settings))
    , m_machine(std::move(machine))
    , m_authority(std::move(authority))
{
    m_accessLog = std::make_unique<Audit::AccessLog>(m_settings.accessLogPath(), m_machine.fingerprint);
    m_licenses = std::make_unique<License::LicenseStore>(
        m_settings, m_machine, m_authority, *m_accessLog, clock);
    m_gate = std::make_unique<License::AccessGate>(*m_licenses);
    m_vault = std::make_unique<SecretVault>(
        m_settings, m_machine.fingerprint, *m_gate, *m_accessLog, clock);
}

VaultService::~VaultService() = default;

} // namespace Varsys::Vault
