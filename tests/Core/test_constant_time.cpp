/**
 * @file test_constant_time.cpp
 * @brief Unit tests for constant-time comparison
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * License signatures, vault payload signatures and checksums are all
 * compared through constantTimeCompare, so both overloads are covered.
 */

#include <Varsys/Core/Crypto.hpp>
#include <Varsys/Core/Types.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Varsys;
using namespace Varsys::Crypto;

// ============================================================================
// Byte Buffers
// ============================================================================

TEST(ConstantTimeCompare, Equal32ByteBuffers_ReturnsTrue) {
    ByteBuffer a(32);
    ByteBuffer b(32);
    for (size_t i = 0; i < 32; ++i) {
        a[i] = static_cast<Byte>(i);
        b[i] = static_cast<Byte>(i);
    }
    
    EXPECT_TRUE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferenceAtFirstByte_ReturnsFalse) {
    ByteBuffer a(32, 0x00);
    ByteBuffer b(32, 0x00);
    b[0] = 0x01;
    
    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferenceAtLastByte_ReturnsFalse) {
    ByteBuffer a(32, 0xAA);
    ByteBuffer b(32, 0xAA);
    b[31] = 0xBB;
    
    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, SingleBitDifferenceAtEveryPosition_ReturnsFalse) {
    ByteBuffer a = Testing::randomBytes(64);
    
    for (size_t bit = 0; bit < a.size() * 8; ++bit) {
        ByteBuffer b = a;
        Testing::BitFlipper::flipBit(b, bit);
        EXPECT_FALSE(constantTimeCompare(a, b)) << "bit " << bit;
    }
}

TEST(ConstantTimeCompare, DifferentLengths_ReturnsFalse) {
    ByteBuffer a(16, 0x11);
    ByteBuffer b(17, 0x11);
    
    EXPECT_FALSE(constantTimeCompare(a, b));
    EXPECT_FALSE(constantTimeCompare(b, a));
}

TEST(ConstantTimeCompare, BothEmpty_ReturnsTrue) {
    ByteBuffer a;
    ByteBuffer b;
    
    EXPECT_TRUE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, EmptyAgainstNonEmpty_ReturnsFalse) {
    ByteBuffer empty;
    ByteBuffer one(1, 0x00);
    
    EXPECT_FALSE(constantTimeCompare(empty, one));
}

TEST(ConstantTimeCompare, VariousSizes_WorkCorrectly) {
    for (size_t size : {1u, 7u, 16u, 31u, 64u, 1000u, 65536u}) {
        ByteBuffer a = Testing::randomBytes(size);
        ByteBuffer b = a;
        EXPECT_TRUE(constantTimeCompare(a, b)) << "size " << size;
        
        b[size / 2] ^= 0x80;
        EXPECT_FALSE(constantTimeCompare(a, b)) << "size " << size;
    }
}

// ============================================================================
// Strings
// ============================================================================

TEST(ConstantTimeCompare, HexDigests_CompareByContent) {
    std::string mac = "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843";
    std::string same = mac;
    std::string other = mac;
    other.back() = '2';
    
    EXPECT_TRUE(constantTimeCompare(std::string_view(mac), std::string_view(same)));
    EXPECT_FALSE(constantTimeCompare(std::string_view(mac), std::string_view(other)));
}

TEST(ConstantTimeCompare, StringPrefix_ReturnsFalse) {
    EXPECT_FALSE(constantTimeCompare(std::string_view("abcdef"), std::string_view("abc")));
    EXPECT_FALSE(constantTimeCompare(std::string_view(""), std::string_view("a")));
    EXPECT_TRUE(constantTimeCompare(std::string_view(""), std::string_view("")));
}

TEST(ConstantTimeCompare, CaseSensitive) {
    EXPECT_FALSE(constantTimeCompare(std::string_view("ABCDEF"), std::string_view("abcdef")));
}
