/**
 * @file MachineIdentity.cpp
 * @brief Linux trait collection and fingerprint hashing
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/License/MachineIdentity.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Logger.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include <sys/utsname.h>
#include <unistd.h>
#include <climits>

namespace Varsys::License {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string readCpuModel() {
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.rfind("model name", 0) == 0) {
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                return trim(line.substr(colon + 1));
            }
        }
    }
    return {};
}

std::string readHardwareAddress() {
    namespace fs = std::filesystem;
    
    std::error_code ec;
    std::vector<std::string> interfaces;
    for (const auto& entry : fs::directory_iterator("/sys/class/net", ec)) {
        std::string name = entry.path().filename().string();
        if (name != "lo") {
            interfaces.push_back(name);
        }
    }
    std::sort(interfaces.begin(), interfaces.end());
    
    for (const auto& name : interfaces) {
        std::ifstream file("/sys/class/net/" + name + "/address");
        std::string address;
        if (!std::getline(file, address)) continue;
        
        address = trim(address);
        if (address.empty() || address == "00:00:00:00:00:00") continue;
        return address;
    }
    return {};
}

} // namespace

MachineTraits MachineIdentity::collect() const {
    MachineTraits traits;
    
    struct utsname info{};
    if (::uname(&info) == 0) {
        traits.platform = std::string(info.sysname) + "-" + info.release + "-" + info.machine;
    }
    
    traits.processor = readCpuModel();
    if (traits.processor.empty() && !traits.platform.empty()) {
        traits.processor = info.machine;
    }
    
    char host[HOST_NAME_MAX + 1] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) {
        traits.hostname = host;
    }
    
    traits.hardwareAddress = readHardwareAddress();
    return traits;
}

std::string MachineIdentity::fingerprint() const noexcept {
    try {
        return fingerprintFrom(collect());
    } catch (const std::exception& e) {
        VARSYS_LOG_WARNING_F("Machine trait collection failed: %s", e.what());
        return fingerprintFrom(MachineTraits{});
    }
}

MachineBinding MachineIdentity::binding() const noexcept {
    MachineBinding result;
    try {
        MachineTraits traits = collect();
        result.fingerprint = fingerprintFrom(traits);
        result.platform = traits.platform.empty() ? std::string("unknown") : traits.platform;
    } catch (const std::exception& e) {
        VARSYS_LOG_WARNING_F("Machine trait collection failed: %s", e.what());
        result.fingerprint = fingerprintFrom(MachineTraits{});
        result.platform = "unknown";
    }
    return result;
}

std::string MachineIdentity::fingerprintFrom(const MachineTraits& traits) noexcept {
    try {
        std::string material;
        if (traits.platform.empty() || traits.processor.empty() || traits.hostname.empty()) {
            VARSYS_LOG_DEBUG("Incomplete machine traits, fingerprinting host name only");
            material = traits.hostname.empty() ? UNKNOWN_HOST : traits.hostname;
        } else {
            json identity = {
                {"hostname", traits.hostname},
                {"mac", traits.hardwareAddress},
                {"platform", traits.platform},
                {"processor", traits.processor}
            };
            material = identity.dump();
        }
        
        auto digest = Crypto::HashEngine::sha256(asBytes(material));
        if (digest.isFailure()) {
            VARSYS_LOG_ERROR("SHA-256 unavailable for fingerprint");
            return std::string(FINGERPRINT_LENGTH, '0');
        }
        return Crypto::toHex(digest.value()).substr(0, FINGERPRINT_LENGTH);
    } catch (const std::exception& e) {
        VARSYS_LOG_ERROR_F("Fingerprint computation failed: %s", e.what());
        return std::string(FINGERPRINT_LENGTH, '0');
    }
}

} // namespace Varsys::License
