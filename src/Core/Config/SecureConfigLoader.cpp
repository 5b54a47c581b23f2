/**
 * @file SecureConfigLoader.cpp
 * @brief Implementation of secure configuration loading
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/Config.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Logger.hpp>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Varsys::Config {

namespace {

std::string trim(const std::string& text, const char* whitespace = " \t\r\n") {
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

ConfigValue inferValue(const std::string& raw) {
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return raw.substr(1, raw.size() - 2);
    }
    if (raw == "true") {
        return true;
    }
    if (raw == "false") {
        return false;
    }
    
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    
    int64_t integer = 0;
    auto [intEnd, intErr] = std::from_chars(begin, end, integer);
    if (intErr == std::errc() && intEnd == end && !raw.empty()) {
        return integer;
    }
    
    // strtod stands in for from_chars(double), which older libstdc++ lacks
    if (!raw.empty() && raw.find_first_not_of("0123456789.+-eE") == std::string::npos) {
        char* parsedEnd = nullptr;
        errno = 0;
        double real = std::strtod(raw.c_str(), &parsedEnd);
        if (errno == 0 && parsedEnd == raw.c_str() + raw.size()) {
            return real;
        }
    }
    
    return raw;
}

} // namespace

class SecureConfigLoader::Impl {
public:
    Options options;
    
    explicit Impl(const Options& opts) : options(opts) {}
    
    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = ::realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        std::free(resolved);
        return result;
    }
    
    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }
        
        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return ErrorCode::InvalidPath;
        }
        
        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed.push_back('/');
        }
        
        // "/etc/varsys-other" must not pass for allowed "/etc/varsys"
        return canonicalPath.compare(0, allowed.size(), allowed) == 0;
    }
    
    Result<ByteBuffer> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();
        
        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            VARSYS_LOG_WARNING_F("Config path outside allowed directory: %s", canonPath.c_str());
            return ErrorCode::AccessDenied;
        }
        
        int fd = ::open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::FileAccessDenied;
        }
        
        // Size from the open descriptor, not the path
        struct stat st;
        if (::fstat(fd, &st) < 0 || !S_ISREG(st.st_mode)) {
            ::close(fd);
            return ErrorCode::IOError;
        }
        
        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            ::close(fd);
            return ErrorCode::FileTooLarge;
        }
        
        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = ::read(fd, data.data() + total, data.size() - total);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        ::close(fd);
        
        if (total != data.size()) {
            return ErrorCode::IOError;
        }
        
        return data;
    }
    
    Result<bool> verifySignature(ByteSpan data, ByteSpan signature) {
        if (!options.verify_signature) {
            return true;
        }
        
        if (options.signature_key.empty()) {
            return ErrorCode::InvalidKey;
        }
        
        std::string hex = trim(std::string(signature.begin(), signature.end()));
        auto mac = Crypto::fromHex(hex);
        if (mac.isFailure()) {
            return false;
        }
        
        Crypto::HMAC hmac(options.signature_key);
        return hmac.verify(data, mac.value());
    }
    
    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;
        
        std::string content(reinterpret_cast<const char*>(data.data()), data.size());
        std::istringstream stream(content);
        std::string line;
        size_t lineNumber = 0;
        
        while (std::getline(stream, line)) {
            ++lineNumber;
            line = trim(line);
            
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }
            
            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                VARSYS_LOG_ERROR_F("Config line %zu has no '=' separator", lineNumber);
                return ErrorCode::ConfigParseFailed;
            }
            
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            
            if (key.empty()) {
                VARSYS_LOG_ERROR_F("Config line %zu has an empty key", lineNumber);
                return ErrorCode::ConfigParseFailed;
            }
            
            config[key] = inferValue(value);
        }
        
        return config;
    }
};

SecureConfigLoader::SecureConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

SecureConfigLoader::~SecureConfigLoader() = default;

Result<ConfigMap> SecureConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }
    
    ByteBuffer signature;
    if (m_impl->options.verify_signature) {
        auto sigResult = m_impl->readFileSecurely(path + ".sig");
        if (sigResult.isFailure()) {
            VARSYS_LOG_ERROR_F("Signature file missing for %s", path.c_str());
            return ErrorCode::SignatureInvalid;
        }
        signature = std::move(sigResult.value());
    }
    
    return loadFromMemory(dataResult.value(), signature);
}

Result<ConfigMap> SecureConfigLoader::loadFromMemory(
    ByteSpan data,
    ByteSpan signature) {
    
    if (m_impl->options.verify_signature) {
        auto verifyResult = m_impl->verifySignature(data, signature);
        if (verifyResult.isFailure()) {
            return verifyResult.error();
        }
        if (!verifyResult.value()) {
            VARSYS_LOG_CRITICAL("Configuration signature mismatch");
            return ErrorCode::SignatureInvalid;
        }
    }
    
    return m_impl->parseConfig(data);
}

} // namespace Varsys::Config
