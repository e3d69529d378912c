#ifndef ISOFETCH_HASHER_HPP
#define ISOFETCH_HASHER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../common/cancellation.hpp"

enum class ChecksumAlgorithm {
    MD5,
    SHA256,
    SHA512
};

namespace Hasher {

// Tags accepted by parse_algorithm, in their canonical spelling.
const std::vector<std::string>& supported_algorithms();

/**
 * @brief Maps a tag such as "sha256" (case-insensitive) to an algorithm.
 * @throws ValidationError for unknown tags.
 */
ChecksumAlgorithm parse_algorithm(const std::string& tag);

bool is_supported_algorithm(const std::string& tag);

std::string algorithm_name(ChecksumAlgorithm algorithm);

// Lowercase hex digest of an in-memory buffer.
std::string digest(const std::string& data, ChecksumAlgorithm algorithm);

/**
 * @brief Lowercase hex digest of a file, streamed in fixed-size blocks.
 *
 * The whole file is never held in memory. The token is checked between
 * blocks so that hashing a multi-gigabyte image can be abandoned.
 * @throws std::runtime_error if the file cannot be read.
 * @throws CancelledError if the token fires mid-stream.
 */
std::string file_digest(const std::filesystem::path& path, ChecksumAlgorithm algorithm,
                        const CancellationToken& token = CancellationToken());

std::string file_digest(const std::filesystem::path& path, const std::string& algorithm_tag,
                        const CancellationToken& token = CancellationToken());

std::string to_hex(const uint8_t* data, size_t len);

} // namespace Hasher

#endif // ISOFETCH_HASHER_HPP
