#include "hashmirror/crypto/hash.hpp"

#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hm::crypto::hash {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 8192;

void ensureSodium() {
    static const int rc = sodium_init();
    if (rc < 0) throw std::runtime_error("libsodium failed to initialize");
}

std::ifstream openForHashing(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());
    return file;
}

template <typename Update>
void streamFile(std::ifstream& file, const std::filesystem::path& filepath, Update&& update) {
    char buffer[READ_BUFFER_SIZE];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + filepath.string());
        if (const auto n = file.gcount(); n > 0)
            update(reinterpret_cast<const unsigned char*>(buffer), static_cast<unsigned long long>(n));
    }
}

}

std::string sha256(const std::filesystem::path& filepath) {
    ensureSodium();
    auto file = openForHashing(filepath);

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    streamFile(file, filepath, [&](const unsigned char* data, const unsigned long long len) {
        crypto_hash_sha256_update(&state, data, len);
    });

    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state, hash);
    return toHex(hash, sizeof(hash));
}

std::string blake2b(const std::filesystem::path& filepath) {
    ensureSodium();
    auto file = openForHashing(filepath);

    constexpr size_t hash_len = crypto_generichash_BYTES;
    static_assert(hash_len == DIGEST_SIZE);

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);
    streamFile(file, filepath, [&](const unsigned char* data, const unsigned long long len) {
        crypto_generichash_update(&state, data, len);
    });

    unsigned char hash[hash_len];
    crypto_generichash_final(&state, hash, hash_len);
    return toHex(hash, hash_len);
}

std::string file(const std::filesystem::path& filepath, const Algorithm algo) {
    switch (algo) {
        case Algorithm::SHA256: return sha256(filepath);
        case Algorithm::BLAKE2b: return blake2b(filepath);
    }
    throw std::invalid_argument("Unknown hash algorithm");
}

std::string toHex(const unsigned char* digest, const std::size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return result.str();
}

std::string_view toString(const Algorithm algo) {
    switch (algo) {
        case Algorithm::SHA256: return "sha256";
        case Algorithm::BLAKE2b: return "blake2b";
    }
    return "unknown";
}

std::optional<Algorithm> parseAlgorithm(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });
    std::erase(lower, '-');

    if (lower == "sha256") return Algorithm::SHA256;
    if (lower == "blake2b" || lower == "blake2b256") return Algorithm::BLAKE2b;
    return std::nullopt;
}

}
