/**
 * @file hash_utils.cpp
 * @brief Implementation of OpenSSL digest and randomness helpers
 *
 * **Uses**:
 * - **Launcher refresh**: the launcher copy inside each control directory is
 *   rewritten only when its SHA-256 differs from the installed launcher.
 * - **Run identifiers**: request/response artifacts carry a random 128-bit id
 *   so sequential calls on one Sandbox never reuse a file name.
 *
 * **Error Handling**:
 * - File not found: Throws std::runtime_error
 * - RAND_bytes failure: Throws std::runtime_error
 *
 * @date 2025
 */

#include "warden/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace warden {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    SHA256_CTX sha256_context;
    SHA256_Init(&sha256_context);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&sha256_context, buffer, file.gcount());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256_context);

    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::RandomHex(std::size_t byte_count) {
    std::vector<unsigned char> bytes(byte_count);
    if (byte_count > 0 &&
        RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce random data");
    }
    return BinaryToHex(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace warden
