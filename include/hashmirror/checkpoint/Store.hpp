#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

namespace hm::checkpoint {

using CheckpointSet = std::unordered_set<std::string>;

/**
 * Persisted set of relative paths already confirmed identical between source
 * and destination. The file holds one path per line and is only ever appended
 * to; duplicates left behind by an interrupted run collapse on the next load.
 */
class Store {
public:
    explicit Store(std::filesystem::path path);

    // Reads the file into memory. A missing file is an empty set.
    const CheckpointSet& load();

    [[nodiscard]] bool contains(const std::string& rel) const { return entries_.contains(rel); }

    // Appends rel as a single line and flushes. No-op if rel is already present.
    // Returns false, writing nothing, for a path containing '\n' or '\r'.
    // Throws std::runtime_error when the file cannot be appended to.
    bool add(const std::string& rel);

    [[nodiscard]] const CheckpointSet& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    static CheckpointSet read(const std::filesystem::path& path);
    static void append(const std::filesystem::path& path, std::string_view rel);

private:
    std::filesystem::path path_;
    CheckpointSet entries_;
};

}
