/**
 * @file CryptoUtils.cpp
 * @brief Hex and base64 encoding
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Base64 decoding is strict: any input that is not the canonical
 * encoding of some byte string is rejected with InvalidBase64.
 */

#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace Varsys::Crypto {

namespace {

int hexNibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isBase64Char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string toHex(ByteSpan data) {
    static constexpr char digits[] = "0123456789abcdef";
    
    std::string result;
    result.reserve(data.size() * 2);
    for (Byte b : data) {
        result.push_back(digits[(b >> 4) & 0x0F]);
        result.push_back(digits[b & 0x0F]);
    }
    return result;
}

Result<ByteBuffer> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return ErrorCode::InvalidHexString;
    }
    
    ByteBuffer result;
    result.reserve(hex.size() / 2);
    
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hexNibble(hex[i]);
        int low = hexNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return ErrorCode::InvalidHexString;
        }
        result.push_back(static_cast<Byte>((high << 4) | low));
    }
    
    return result;
}

// ============================================================================
// Base64 Encoding/Decoding
// ============================================================================

std::string toBase64(ByteSpan data) {
    if (data.empty()) {
        return "";
    }
    
    BIOChainPtr chain(BIO_push(BIO_new(BIO_f_base64()), BIO_new(BIO_s_mem())));
    if (!chain) {
        return "";
    }
    BIO_set_flags(chain, BIO_FLAGS_BASE64_NO_NL);
    
    if (BIO_write(chain, data.data(), static_cast<int>(data.size())) <= 0 ||
        BIO_flush(chain) != 1) {
        return "";
    }
    
    BUF_MEM* memory = nullptr;
    BIO_get_mem_ptr(chain, &memory);
    if (memory == nullptr) {
        return "";
    }
    
    return std::string(memory->data, memory->length);
}

Result<ByteBuffer> fromBase64(std::string_view base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }
    if (base64.size() % 4 != 0) {
        return ErrorCode::InvalidBase64;
    }
    
    size_t padding = 0;
    if (base64.back() == '=') {
        padding = (base64[base64.size() - 2] == '=') ? 2 : 1;
    }
    
    const size_t dataChars = base64.size() - padding;
    for (size_t i = 0; i < dataChars; ++i) {
        if (!isBase64Char(base64[i])) {
            return ErrorCode::InvalidBase64;
        }
    }
    
    // EVP_DecodeBlock writes 3 bytes per 4 characters including padding
    ByteBuffer decoded((base64.size() / 4) * 3);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(base64.data()),
                                  static_cast<int>(base64.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return ErrorCode::InvalidBase64;
    }
    
    decoded.resize(static_cast<size_t>(written) - padding);
    
    // Stray low bits in the final symbol
    if (toBase64(decoded) != base64) {
        return ErrorCode::InvalidBase64;
    }
    
    return decoded;
}

bool isValidUtf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }
        
        size_t length = 0;
        uint32_t codePoint = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07;
        } else {
            return false;
        }
        
        if (text.size() - i < length) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }
        
        static constexpr uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (codePoint < minimum[length] || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace Varsys::Crypto
