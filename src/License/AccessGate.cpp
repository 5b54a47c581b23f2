/**
 * @file AccessGate.cpp
 * @brief Feature gate implementation
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/AccessGate.hpp>
#include <Varsys/License/LicenseStore.hpp>
#include <Varsys/Core/Logger.hpp>

namespace Varsys::License {

bool AccessGate::isFeatureEnabled(std::string_view feature) noexcept {
    return m_store.isFeatureEnabled(feature);
}

Result<AccessToken> AccessGate::authorize(std::string_view feature) {
    auto record = m_store.verify();
    if (record.isFailure()) {
        VARSYS_LOG_DEBUG_F("Feature %.*s denied: %s",
                           static_cast<int>(feature.size()), feature.data(),
                           std::string(getErrorName(record.error())).c_str());
        return ErrorCode::LicenseRequired;
    }
    if (!record.value().grants(feature)) {
        VARSYS_LOG_DEBUG_F("Feature %.*s not included in license",
                           static_cast<int>(feature.size()), feature.data());
        return ErrorCode::LicenseRequired;
    }
    return AccessToken(std::move(record.value()), std::string(feature));
}

} // namespace Varsys::License
