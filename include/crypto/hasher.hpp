#ifndef BURSTPACK_HASHER_HPP
#define BURSTPACK_HASHER_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

// SHA-256 produces a 32-byte hash.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a file's contents, reading it in blocks.
 * @throws std::runtime_error if the file cannot be opened or read.
 */
hash_t sha256_file(const std::filesystem::path& path);

// Lowercase hex encoding of a hash.
std::string hash_to_hex(const hash_t& hash);

} // namespace Hasher

#endif //BURSTPACK_HASHER_HPP
