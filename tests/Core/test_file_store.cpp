/**
 * @file test_file_store.cpp
 * @brief Tests for atomic writes, appends and secure erase
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 */

#include <Varsys/Core/FileStore.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <sys/stat.h>

using namespace Varsys;
using namespace Varsys::Testing;

namespace fs = std::filesystem;

class FileStoreTest : public ::testing::Test {
protected:
    TempDirectory temp;
};

// ============================================================================
// Reading
// ============================================================================

TEST_F(FileStoreTest, ReadMissingFile_FileNotFound) {
    EXPECT_ERROR(IO::readFile(temp.file("missing.dat")), ErrorCode::FileNotFound);
    EXPECT_FALSE(IO::fileExists(temp.file("missing.dat")));
}

TEST_F(FileStoreTest, ReadDirectory_Rejected) {
    EXPECT_FALSE(IO::fileExists(temp.path()));
    EXPECT_TRUE(IO::readFile(temp.path()).isFailure());
}

TEST_F(FileStoreTest, ReadRespectsSizeLimit) {
    writeFileText(temp.file("big.dat"), std::string(4096, 'a'));
    
    EXPECT_ERROR(IO::readFile(temp.file("big.dat"), 1024), ErrorCode::FileTooLarge);
    auto within = IO::readFile(temp.file("big.dat"), 4096);
    ASSERT_RESULT_OK(within);
    EXPECT_EQ(within.value().size(), 4096u);
}

TEST_F(FileStoreTest, ReadThroughSymlink_Refused) {
    writeFileText(temp.file("target.dat"), "payload");
    fs::create_symlink(temp.file("target.dat"), temp.file("link.dat"));
    
    EXPECT_FALSE(IO::fileExists(temp.file("link.dat")));
    EXPECT_ERROR(IO::readFile(temp.file("link.dat")), ErrorCode::FileAccessDenied);
}

// ============================================================================
// Atomic Writes
// ============================================================================

TEST_F(FileStoreTest, WriteAtomic_CreatesFileWithOwnerOnlyMode) {
    std::string path = temp.file("license.dat");
    ASSERT_RESULT_OK(IO::writeFileAtomic(path, asBytes("sealed license")));
    
    auto text = IO::readTextFile(path);
    ASSERT_RESULT_OK(text);
    EXPECT_EQ(text.value(), "sealed license");
    
    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(FileStoreTest, WriteAtomic_ReplacesWithoutLeavingTemporaries) {
    std::string path = temp.file("vault.dat");
    ASSERT_RESULT_OK(IO::writeFileAtomic(path, asBytes("first version, longer text")));
    ASSERT_RESULT_OK(IO::writeFileAtomic(path, asBytes("second")));
    
    EXPECT_EQ(readFileText(path), "second");
    
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(temp.path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileStoreTest, WriteAtomic_MissingDirectory) {
    EXPECT_ERROR(IO::writeFileAtomic(temp.file("no/such/dir/file.dat"), asBytes("x")),
                 ErrorCode::DirectoryNotFound);
}

TEST_F(FileStoreTest, WriteAtomic_EmptyPath) {
    EXPECT_ERROR(IO::writeFileAtomic("", asBytes("x")), ErrorCode::InvalidPath);
}

TEST_F(FileStoreTest, EnsureDirectory_CreatesNestedPath) {
    std::string dir = temp.file("a/b/c");
    ASSERT_RESULT_OK(IO::ensureDirectory(dir));
    EXPECT_TRUE(fs::is_directory(dir));
    ASSERT_RESULT_OK(IO::ensureDirectory(dir));
}

// ============================================================================
// Appends
// ============================================================================

TEST_F(FileStoreTest, AppendLine_AddsNewlineTerminatedRecords) {
    std::string path = temp.file("access.log");
    ASSERT_RESULT_OK(IO::appendLine(path, "{\"a\":1}"));
    ASSERT_RESULT_OK(IO::appendLine(path, "{\"b\":2}"));
    
    EXPECT_EQ(readFileText(path), "{\"a\":1}\n{\"b\":2}\n");
}

// ============================================================================
// Removal and Secure Erase
// ============================================================================

TEST_F(FileStoreTest, RemoveFile) {
    std::string path = temp.file("gone.dat");
    writeFileText(path, "x");
    
    ASSERT_RESULT_OK(IO::removeFile(path));
    EXPECT_FALSE(IO::fileExists(path));
    EXPECT_ERROR(IO::removeFile(path), ErrorCode::FileNotFound);
}

TEST_F(FileStoreTest, SecureErase_OverwritesSharedInode) {
    std::string path = temp.file("vault.dat");
    std::string witness = temp.file("witness.dat");
    const std::string secret(2048, 'S');
    writeFileText(path, secret);
    fs::create_hard_link(path, witness);
    
    ASSERT_RESULT_OK(IO::secureErase(path));
    
    EXPECT_FALSE(IO::fileExists(path));
    
    // The second link still reaches the overwritten blocks
    std::string remains = readFileText(witness);
    EXPECT_GE(remains.size(), IO::SECURE_ERASE_MIN_BYTES);
    EXPECT_EQ(remains.find(std::string(64, 'S')), std::string::npos);
}

TEST_F(FileStoreTest, SecureErase_LargeFileOverwrittenToFullLength) {
    std::string path = temp.file("large.dat");
    std::string witness = temp.file("witness.dat");
    const size_t size = IO::SECURE_ERASE_MIN_BYTES + 4096;
    writeFileText(path, std::string(size, 'L'));
    fs::create_hard_link(path, witness);
    
    ASSERT_RESULT_OK(IO::secureErase(path));
    
    std::string remains = readFileText(witness);
    EXPECT_EQ(remains.size(), size);
    EXPECT_EQ(remains.find(std::string(64, 'L')), std::string::npos);
}

TEST_F(FileStoreTest, SecureErase_MissingFile) {
    EXPECT_ERROR(IO::secureErase(temp.file("missing.dat")), ErrorCode::FileNotFound);
}
