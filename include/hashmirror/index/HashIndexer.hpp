#pragma once

#include "hashmirror/crypto/hash.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hm::index {

// relative path (root stripped, no leading separator) -> hex digest
using PathHashMap = std::unordered_map<std::string, std::string>;

struct IndexError {
    std::string path;       // relative key, or the root itself if the walk failed there
    std::string message;
};

struct IndexResult {
    PathHashMap hashes;
    std::vector<IndexError> errors;
    std::size_t skipped = 0;    // files excluded by the caller, never opened
};

class HashIndexer {
public:
    // Digest of one file; throws when the file cannot be hashed.
    using Hasher = std::function<std::string(const std::filesystem::path&)>;

    // A set hasher replaces the libsodium digest selected by algo.
    explicit HashIndexer(crypto::hash::Algorithm algo = crypto::hash::Algorithm::SHA256, Hasher hasher = nullptr);

    /**
     * Walks root recursively and hashes every regular file beneath it.
     *
     * Keys found in exclude are counted as skipped and never read. Files that
     * cannot be hashed, and subtrees that cannot be entered, are reported in
     * IndexResult::errors without stopping the walk. A root that does not exist
     * or is not a directory yields an empty result; callers decide whether that
     * is fatal.
     */
    [[nodiscard]] IndexResult build(const std::filesystem::path& root,
                                    const std::unordered_set<std::string>* exclude = nullptr) const;

    [[nodiscard]] crypto::hash::Algorithm algorithm() const { return algo_; }

    static std::string relativeKey(const std::filesystem::path& root, const std::filesystem::path& file);

private:
    crypto::hash::Algorithm algo_;
    Hasher hasher_;

    [[nodiscard]] std::string digest(const std::filesystem::path& file) const;
};

// Shorthand for HashIndexer(algo).build(root)
IndexResult buildHashMap(const std::filesystem::path& root,
                         crypto::hash::Algorithm algo = crypto::hash::Algorithm::SHA256);

}
