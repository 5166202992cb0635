#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hm::crypto::hash {

// Both algorithms produce a 256-bit digest, hex-encoded to 64 characters.
enum class Algorithm { SHA256, BLAKE2b };

inline constexpr std::size_t DIGEST_SIZE = 32;

// Streams the file through the selected digest. Throws std::runtime_error
// when the file cannot be opened or read.
std::string file(const std::filesystem::path& filepath, Algorithm algo = Algorithm::SHA256);

std::string sha256(const std::filesystem::path& filepath);
std::string blake2b(const std::filesystem::path& filepath);

std::string toHex(const unsigned char* digest, std::size_t len);

std::string_view toString(Algorithm algo);
std::optional<Algorithm> parseAlgorithm(std::string_view name);

}
