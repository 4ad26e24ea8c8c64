#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

enum class DigestAlgorithm {
    MD5,
    SHA256
};

// Picks the algorithm from the length of a hex digest (32 -> MD5, 64 -> SHA256).
// Throws InvalidRequestError for any other length or a non-hex character.
DigestAlgorithm digest_algorithm_for(const std::string& hex_digest);

// Lower-case hex digest of the whole file.
// Throws FilesystemError if the file cannot be read.
std::string calculate_digest(const fs::path& file_path, DigestAlgorithm algorithm);
std::string calculate_md5(const fs::path& file_path);
std::string calculate_sha256(const fs::path& file_path);

// True when the file's digest equals expected_hex (case-insensitive).
bool verify_checksum(const fs::path& file_path, const std::string& expected_hex);
