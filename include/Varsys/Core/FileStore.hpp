/**
 * @file FileStore.hpp
 * @brief Durable file primitives for license and vault storage
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Every persisted file in Varsys is replaced with write-temp, fsync and
 * rename so a reader never observes a partially written file.
 */

#pragma once

#ifndef VARSYS_CORE_FILE_STORE_HPP
#define VARSYS_CORE_FILE_STORE_HPP

#include <Varsys/Core/Types.hpp>
#include <Varsys/Core/ErrorCodes.hpp>

#include <string>

namespace Varsys::IO {

/// Upper bound for files read through readFile()
constexpr size_t MAX_STORED_FILE_SIZE = 16 * 1024 * 1024;

/// Minimum number of random bytes written over a file by secureErase()
constexpr size_t SECURE_ERASE_MIN_BYTES = 1024 * 1024;

/**
 * @brief Check whether a regular file exists at path
 */
bool fileExists(const std::string& path) noexcept;

/**
 * @brief Read an entire file
 * 
 * Symlinks are refused (O_NOFOLLOW).
 * 
 * @param path File path
 * @param maxSize Reject files larger than this
 * @return File contents, FileNotFound, FileAccessDenied, FileTooLarge or FileReadError
 */
Result<ByteBuffer> readFile(const std::string& path, size_t maxSize = MAX_STORED_FILE_SIZE);

/**
 * @brief Read an entire file as text
 */
Result<std::string> readTextFile(const std::string& path, size_t maxSize = MAX_STORED_FILE_SIZE);

/**
 * @brief Atomically replace a file
 * 
 * Writes to a uniquely named sibling, fsyncs it, renames it over path and
 * fsyncs the parent directory. The file is created with mode 0600.
 * 
 * @param path Destination path
 * @param data New file contents
 * @return Success, or FileWriteError / DiskFull / FileAccessDenied
 */
Result<void> writeFileAtomic(const std::string& path, ByteSpan data);

/**
 * @brief Append one line to a file, creating it when absent
 */
Result<void> appendLine(const std::string& path, std::string_view line);

/**
 * @brief Remove a file
 * @return Success, FileNotFound, or IOError
 */
Result<void> removeFile(const std::string& path);

/**
 * @brief Overwrite a file in place with random bytes, then remove it
 * 
 * At least max(minBytes, current size) bytes from the CSPRNG are written
 * over the existing inode and flushed with fsync before the name is
 * unlinked. Other hard links to the inode observe the random content.
 * 
 * @param path File to erase
 * @param minBytes Minimum overwrite length
 * @return Success, FileNotFound, or FileWriteError
 */
Result<void> secureErase(const std::string& path, size_t minBytes = SECURE_ERASE_MIN_BYTES);

/**
 * @brief Create a directory and its parents when missing
 */
Result<void> ensureDirectory(const std::string& path);

} // namespace Varsys::IO

#endif // VARSYS_CORE_FILE_STORE_HPP
