/**
 * @file varsysctl.cpp
 * @brief Command-line front end for the license-gated vault
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/Config.hpp>
#include <Varsys/Core/Logger.hpp>
#include <Varsys/Vault/VaultService.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace Varsys;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void printUsage() {
    std::cerr
        << "Usage: varsysctl [options] <command> [arguments]\n"
        << "\n"
        << "Commands:\n"
        << "  activate <license-key> <email>   Activate a license on this machine\n"
        << "  status                           Show license state and details\n"
        << "  deactivate                       Remove the license from this machine\n"
        << "  store <file|->                   Protect a JSON configuration object\n"
        << "  retrieve                         Print the protected configuration\n"
        << "  destroy                          Securely erase the vault\n"
        << "  audit [count]                    Show the most recent audit entries\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>     Settings file (key = value)\n"
        << "  --data-dir <dir>    Directory holding license and vault files\n"
        << "  --verbose           Log debug output to stderr\n";
}

int fail(ErrorCode error) {
    std::cerr << "error: " << getErrorMessage(error)
              << " (" << getCategoryName(getErrorCategory(error))
              << "/" << getErrorName(error) << ")" << std::endl;
    return EXIT_FAILED;
}

std::string formatTime(UnixTime when) {
    std::time_t t = static_cast<std::time_t>(when);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer, n);
}

Result<std::string> readInput(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return ErrorCode::FileNotFound;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// ============================================================================
// Commands
// ============================================================================

int cmdActivate(Vault::VaultService& service, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        printUsage();
        return EXIT_USAGE;
    }
    auto activated = service.licenses().activate(args[0], args[1]);
    if (activated.isFailure()) {
        return fail(activated.error());
    }
    std::cout << "License activated" << std::endl;
    return EXIT_OK;
}

int cmdStatus(Vault::VaultService& service) {
    License::LicenseState state = service.licenses().status();
    std::cout << "Machine:  " << service.machineFingerprint() << "\n"
              << "State:    " << License::toString(state) << "\n";
    
    if (state == License::LicenseState::Active) {
        auto info = service.licenses().info();
        if (info.isSuccess()) {
            const auto& details = info.value();
            std::cout << "Email:    " << details.email << "\n"
                      << "Type:     " << details.license_type << "\n"
                      << "Expires:  " << formatTime(details.expires_at)
                      << " (" << details.days_remaining << " days)\n"
                      << "Checked:  " << formatTime(details.last_online_check) << "\n"
                      << "Features:";
            for (const auto& feature : details.features) {
                std::cout << " " << feature;
            }
            std::cout << "\n";
        }
    }
    std::cout.flush();
    return state == License::LicenseState::Active ? EXIT_OK : EXIT_FAILED;
}

int cmdDeactivate(Vault::VaultService& service) {
    auto removed = service.licenses().deactivate();
    if (removed.isFailure()) {
        return fail(removed.error());
    }
    std::cout << "License deactivated" << std::endl;
    return EXIT_OK;
}

int cmdStore(Vault::VaultService& service, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return EXIT_USAGE;
    }
    auto input = readInput(args[0]);
    if (input.isFailure()) {
        return fail(input.error());
    }
    
    json config = json::parse(input.value(), nullptr, false);
    if (config.is_discarded()) {
        return fail(ErrorCode::JsonParseFailed);
    }
    
    auto stored = service.vault().store(config);
    if (stored.isFailure()) {
        return fail(stored.error());
    }
    std::cout << "Configuration stored" << std::endl;
    return EXIT_OK;
}

int cmdRetrieve(Vault::VaultService& service) {
    auto config = service.vault().retrieve();
    if (config.isFailure()) {
        return fail(config.error());
    }
    std::cout << config.value().dump(2) << std::endl;
    return EXIT_OK;
}

int cmdDestroy(Vault::VaultService& service) {
    auto destroyed = service.vault().destroy();
    if (destroyed.isFailure()) {
        return fail(destroyed.error());
    }
    std::cout << "Vault destroyed" << std::endl;
    return EXIT_OK;
}

int cmdAudit(Vault::VaultService& service, const std::vector<std::string>& args) {
    size_t count = 20;
    if (!args.empty()) {
        try {
            count = static_cast<size_t>(std::stoul(args[0]));
        } catch (const std::exception&) {
            printUsage();
            return EXIT_USAGE;
        }
    }
    
    auto entries = service.auditLog().entries();
    if (entries.isFailure()) {
        return fail(entries.error());
    }
    
    const auto& all = entries.value();
    size_t first = all.size() > count ? all.size() - count : 0;
    for (size_t i = first; i < all.size(); ++i) {
        const auto& entry = all[i];
        std::cout << entry.timestamp << "  "
                  << (entry.success ? "OK  " : "FAIL") << "  "
                  << entry.action << "  " << entry.details << "\n";
    }
    std::cout.flush();
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string dataDir;
    bool verbose = false;
    std::vector<std::string> positional;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_OK;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "unknown option: " << arg << std::endl;
            printUsage();
            return EXIT_USAGE;
        } else {
            positional.push_back(arg);
        }
    }
    
    if (positional.empty()) {
        printUsage();
        return EXIT_USAGE;
    }
    
    Config::Settings settings = Config::Settings::defaults();
    if (!configPath.empty()) {
        Config::SecureConfigLoader loader;
        auto loaded = loader.load(configPath);
        if (loaded.isFailure()) {
            return fail(loaded.error());
        }
        auto parsed = Config::Settings::fromConfigMap(loaded.value());
        if (parsed.isFailure()) {
            return fail(parsed.error());
        }
        settings = std::move(parsed.value());
    }
    settings.applyEnvironment(Config::systemEnvironment());
    if (!dataDir.empty()) {
        settings.dataDir = dataDir;
    }
    
    auto& logger = Core::Logger::Instance();
    Core::LogOutput outputs = Core::LogOutput::Console;
    std::string logPath;
    if (!settings.logFile.empty()) {
        outputs = outputs | Core::LogOutput::File;
        logPath = settings.resolve(settings.logFile);
    }
    Core::LogLevel level = verbose ? Core::LogLevel::Debug
                                   : std::max(settings.logLevel, Core::LogLevel::Warning);
    if (!logger.Initialize(level, outputs, logPath)) {
        std::cerr << "warning: logging could not be initialized" << std::endl;
    }
    
    License::MachineIdentity identity;
    auto service = Vault::VaultService::create(settings, identity);
    if (service.isFailure()) {
        return fail(service.error());
    }
    
    Vault::VaultService& vaultService = *service.value();
    const std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    
    int status = EXIT_USAGE;
    if (command == "activate") {
        status = cmdActivate(vaultService, args);
    } else if (command == "status") {
        status = cmdStatus(vaultService);
    } else if (command == "deactivate") {
        status = cmdDeactivate(vaultService);
    } else if (command == "store") {
        status = cmdStore(vaultService, args);
    } else if (command == "retrieve") {
        status = cmdRetrieve(vaultService);
    } else if (command == "destroy") {
        status = cmdDestroy(vaultService);
    } else if (command == "audit") {
        status = cmdAudit(vaultService, args);
    } else {
        std::cerr << "unknown command: " << command << std::endl;
        printUsage();
    }
    
    logger.Shutdown();
    return status;
}
