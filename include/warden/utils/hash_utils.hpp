/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests and random identifiers backed by OpenSSL
 *
 * The provisioner compares launcher digests to decide whether the cached copy
 * in a control directory must be rewritten; the dispatcher names per-call
 * artifacts with random run identifiers.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace warden {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL digest and randomness helpers
 *
 * **Usage Example**:
 * @code
 * if (HashUtils::ComputeSHA256(installed) != HashUtils::ComputeSHA256(source)) {
 *     // refresh installed copy
 * }
 * std::string run_id = HashUtils::RandomHex(16);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a file, streamed in 8KB chunks
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief SHA-256 of an in-memory buffer
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Cryptographically random bytes rendered as hex
     *
     * @param byte_count Number of random bytes (hex length is twice this)
     * @throws std::runtime_error if RAND_bytes fails
     */
    static std::string RandomHex(std::size_t byte_count);

    /**
     * @brief Convert binary digest to lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace warden
