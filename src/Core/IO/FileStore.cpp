/**
 * @file FileStore.cpp
 * @brief POSIX implementation of the durable file primitives
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/FileStore.hpp>
#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Varsys::IO {

namespace {

ErrorCode mapOpenError(int err) noexcept {
    switch (err) {
        case ENOENT:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
        case ELOOP:
            return ErrorCode::FileAccessDenied;
        case ENOSPC:
            return ErrorCode::DiskFull;
        case ENOTDIR:
            return ErrorCode::DirectoryNotFound;
        default:
            return ErrorCode::IOError;
    }
}

/**
 * @brief Closes a descriptor on scope exit unless released
 */
class FdGuard {
public:
    explicit FdGuard(int fd) : m_fd(fd) {}
    ~FdGuard() {
        if (m_fd >= 0) ::close(m_fd);
    }
    
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    
    int get() const { return m_fd; }
    
    int release() {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }

private:
    int m_fd;
};

Result<void> writeAll(int fd, const Byte* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno == ENOSPC ? ErrorCode::DiskFull : ErrorCode::FileWriteError;
        }
        written += static_cast<size_t>(n);
    }
    return {};
}

std::string parentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

void syncDirectory(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    // Best effort: some filesystems reject fsync on directories
    (void)::fsync(fd);
    ::close(fd);
}

} // namespace

bool fileExists(const std::string& path) noexcept {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Result<ByteBuffer> readFile(const std::string& path, size_t maxSize) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (fd.get() < 0) {
        return mapOpenError(errno);
    }
    
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return ErrorCode::FileReadError;
    }
    if (!S_ISREG(st.st_mode)) {
        return ErrorCode::InvalidPath;
    }
    if (static_cast<size_t>(st.st_size) > maxSize) {
        return ErrorCode::FileTooLarge;
    }
    
    ByteBuffer contents;
    contents.reserve(static_cast<size_t>(st.st_size));
    
    Byte chunk[8192];
    while (true) {
        ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            return ErrorCode::FileReadError;
        }
        if (n == 0) break;
        if (contents.size() + static_cast<size_t>(n) > maxSize) {
            return ErrorCode::FileTooLarge;
        }
        contents.insert(contents.end(), chunk, chunk + n);
    }
    
    return contents;
}

Result<std::string> readTextFile(const std::string& path, size_t maxSize) {
    auto bytes = readFile(path, maxSize);
    if (bytes.isFailure()) {
        return bytes.error();
    }
    const auto& data = bytes.value();
    return std::string(data.begin(), data.end());
}

Result<void> writeFileAtomic(const std::string& path, ByteSpan data) {
    if (path.empty()) {
        return ErrorCode::InvalidPath;
    }
    
    Crypto::SecureRandom rng;
    auto suffix = rng.generate(6);
    if (suffix.isFailure()) {
        return suffix.error();
    }
    std::string tempPath = path + ".tmp." + std::to_string(::getpid()) + "." +
                           Crypto::toHex(suffix.value());
    
    FdGuard fd(::open(tempPath.c_str(),
                      O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600));
    if (fd.get() < 0) {
        ErrorCode err = mapOpenError(errno);
        VARSYS_LOG_ERROR_F("Cannot create %s: %s", tempPath.c_str(), std::strerror(errno));
        return err == ErrorCode::FileNotFound ? ErrorCode::DirectoryNotFound : err;
    }
    
    auto written = writeAll(fd.get(), data.data(), data.size());
    if (written.isFailure() || ::fsync(fd.get()) != 0) {
        ::unlink(tempPath.c_str());
        return written.isFailure() ? written.error() : ErrorCode::FileWriteError;
    }
    
    if (::close(fd.release()) != 0) {
        ::unlink(tempPath.c_str());
        return ErrorCode::FileWriteError;
    }
    
    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        VARSYS_LOG_ERROR_F("Cannot replace %s: %s", path.c_str(), std::strerror(errno));
        ::unlink(tempPath.c_str());
        return ErrorCode::FileWriteError;
    }
    
    syncDirectory(parentDirectory(path));
    return {};
}

Result<void> appendLine(const std::string& path, std::string_view line) {
    FdGuard fd(::open(path.c_str(),
                      O_WRONLY | O_CREAT | O_APPEND | O_NOFOLLOW | O_CLOEXEC, 0600));
    if (fd.get() < 0) {
        return mapOpenError(errno);
    }
    
    std::string buffer;
    buffer.reserve(line.size() + 1);
    buffer.append(line);
    buffer.push_back('\n');
    
    // A single write keeps concurrent appenders from interleaving lines
    return writeAll(fd.get(), reinterpret_cast<const Byte*>(buffer.data()), buffer.size());
}

Result<void> removeFile(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::IOError;
    }
    return {};
}

Result<void> secureErase(const std::string& path, size_t minBytes) {
    FdGuard fd(::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_CLOEXEC));
    if (fd.get() < 0) {
        return mapOpenError(errno);
    }
    
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return ErrorCode::FileWriteError;
    }
    
    const size_t total = std::max(minBytes, static_cast<size_t>(st.st_size));
    
    Crypto::SecureRandom rng;
    ByteBuffer chunk(64 * 1024);
    size_t remaining = total;
    while (remaining > 0) {
        const size_t n = std::min(remaining, chunk.size());
        VARSYS_TRY(rng.generate(chunk.data(), n));
        VARSYS_TRY(writeAll(fd.get(), chunk.data(), n));
        remaining -= n;
    }
    
    if (::fsync(fd.get()) != 0) {
        return ErrorCode::FileWriteError;
    }
    Crypto::secureZero(chunk.data(), chunk.size());
    
    if (::close(fd.release()) != 0) {
        return ErrorCode::FileWriteError;
    }
    
    if (::unlink(path.c_str()) != 0) {
        return ErrorCode::IOError;
    }
    
    syncDirectory(parentDirectory(path));
    return {};
}

Result<void> ensureDirectory(const std::string& path) {
    if (path.empty()) {
        return ErrorCode::InvalidPath;
    }
    
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return mapOpenError(ec.value());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return ErrorCode::DirectoryNotFound;
    }
    return {};
}

} // namespace Varsys::IO
