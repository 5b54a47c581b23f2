/**
 * @file test_error_codes.cpp
 * @brief Tests for error code names, messages and categories
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/ErrorCodes.hpp>
#include <gtest/gtest.h>

using namespace Varsys;

TEST(ErrorCodes, CategoryFollowsHighByte) {
    EXPECT_EQ(getErrorCategory(ErrorCode::Success), ErrorCategory::None);
    EXPECT_EQ(getErrorCategory(ErrorCode::Timeout), ErrorCategory::System);
    EXPECT_EQ(getErrorCategory(ErrorCode::DecryptionFailed), ErrorCategory::Crypto);
    EXPECT_EQ(getErrorCategory(ErrorCode::ConnectionFailed), ErrorCategory::Network);
    EXPECT_EQ(getErrorCategory(ErrorCode::ConfigInvalid), ErrorCategory::Config);
    EXPECT_EQ(getErrorCategory(ErrorCode::FileNotFound), ErrorCategory::IO);
    EXPECT_EQ(getErrorCategory(ErrorCode::JsonInvalid), ErrorCategory::Parse);
    EXPECT_EQ(getErrorCategory(ErrorCode::MachineMismatch), ErrorCategory::License);
    EXPECT_EQ(getErrorCategory(ErrorCode::VaultMissing), ErrorCategory::Vault);
    EXPECT_EQ(getErrorCategory(ErrorCode::InvalidArgument), ErrorCategory::Internal);
}

TEST(ErrorCodes, CategoryNames) {
    EXPECT_EQ(getCategoryName(ErrorCategory::License), "License");
    EXPECT_EQ(getCategoryName(ErrorCategory::Vault), "Vault");
    EXPECT_EQ(getCategoryName(getErrorCategory(ErrorCode::CurlInitFailed)), "Network");
}

TEST(ErrorCodes, NamesMatchEnumerators) {
    EXPECT_EQ(getErrorName(ErrorCode::Success), "Success");
    EXPECT_EQ(getErrorName(ErrorCode::LicenseTampered), "LicenseTampered");
    EXPECT_EQ(getErrorName(ErrorCode::OuterTamperDetected), "OuterTamperDetected");
    EXPECT_EQ(getErrorName(ErrorCode::AuthorityUnreachable), "AuthorityUnreachable");
}

TEST(ErrorCodes, MessagesAreHumanReadable) {
    EXPECT_EQ(getErrorMessage(ErrorCode::LicenseExpired), "License expired");
    EXPECT_EQ(getErrorMessage(ErrorCode::VaultMissing), "Vault not found");
    EXPECT_EQ(getErrorMessage(static_cast<ErrorCode>(0x7777)), "Unknown error");
    EXPECT_EQ(getErrorName(static_cast<ErrorCode>(0x7777)), "Unknown");
}

TEST(ErrorCodes, TamperClass) {
    EXPECT_TRUE(isTamperError(ErrorCode::LicenseTampered));
    EXPECT_TRUE(isTamperError(ErrorCode::OuterTamperDetected));
    EXPECT_TRUE(isTamperError(ErrorCode::InnerTamperDetected));
    EXPECT_TRUE(isTamperError(ErrorCode::SignatureInvalid));

    EXPECT_FALSE(isTamperError(ErrorCode::DecryptionFailed));
    EXPECT_FALSE(isTamperError(ErrorCode::MachineMismatch));
    EXPECT_FALSE(isTamperError(ErrorCode::VaultMissing));
    EXPECT_FALSE(isTamperError(ErrorCode::Success));
}
