/**
 * @file hash_utils.hpp
 * @brief Cryptographic digests used to identify submitted samples
 *
 * Samples are identified by SHA-256 in reports, independent of the file name
 * they were uploaded under. Backed by OpenSSL's EVP interface.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace vmsandbox {
namespace utils {

class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a file
     *
     * Streams the file in fixed-size chunks, so large samples are not loaded
     * into memory.
     *
     * @param file_path File to hash
     * @return Lowercase hex digest (64 characters)
     *
     * @throws std::runtime_error if the file cannot be read or OpenSSL fails
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Compute SHA-256 of an in-memory string
     * @param data Bytes to hash
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /// Convert raw bytes to lowercase hex
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace vmsandbox
