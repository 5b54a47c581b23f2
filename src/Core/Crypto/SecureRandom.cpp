/**
 * @file SecureRandom.cpp
 * @brief Cryptographically secure random number generator
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Reads /dev/urandom, retrying on EINTR and short reads.
 */

#include <Varsys/Core/Crypto.hpp>

#include <cerrno>
#include <mutex>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace Varsys::Crypto {

// ============================================================================
// SecureRandom::Impl
// ============================================================================

class SecureRandom::Impl {
public:
    Impl() {
        m_fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
        if (m_fd < 0) {
            throw std::runtime_error("Failed to open /dev/urandom");
        }
    }
    
    ~Impl() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }
    
    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }
        
        std::lock_guard<std::mutex> lock(m_mutex);
        
        size_t total = 0;
        while (total < size) {
            ssize_t n = ::read(m_fd, buffer + total, size - total);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ErrorCode::RandomGenerationFailed;
            }
            if (n == 0) {
                return ErrorCode::RandomGenerationFailed;
            }
            total += static_cast<size_t>(n);
        }
        
        return Result<void>();
    }

private:
    int m_fd = -1;
    std::mutex m_mutex;
};

// ============================================================================
// SecureRandom - Public API
// ============================================================================

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    VARSYS_TRY(m_impl->generate(buffer.data(), size));
    return buffer;
}

Result<AESNonce> SecureRandom::generateNonce() {
    AESNonce nonce;
    VARSYS_TRY(m_impl->generate(nonce.data(), nonce.size()));
    return nonce;
}

} // namespace Varsys::Crypto
