#include "hashmirror/index/HashIndexer.hpp"
#include "hashmirror/log/Registry.hpp"

#include <system_error>

using namespace hm::index;
using namespace hm::log;
namespace fs = std::filesystem;

HashIndexer::HashIndexer(const crypto::hash::Algorithm algo, Hasher hasher)
    : algo_(algo), hasher_(std::move(hasher)) {}

std::string HashIndexer::digest(const fs::path& file) const {
    return hasher_ ? hasher_(file) : crypto::hash::file(file, algo_);
}

std::string HashIndexer::relativeKey(const fs::path& root, const fs::path& file) {
    // "/data/src/" and "/data/src" must produce the same keys
    const auto base = root.has_filename() ? root : root.parent_path();
    auto key = file.lexically_relative(base).string();
    if (key == ".") return {};
    const auto first = key.find_first_not_of(fs::path::preferred_separator);
    if (first == std::string::npos) return {};
    if (first > 0) key.erase(0, first);
    return key;
}

IndexResult HashIndexer::build(const fs::path& root, const std::unordered_set<std::string>* exclude) const {
    IndexResult result;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        Registry::index()->warn("[HashIndexer] Root is not a readable directory: {}", root.string());
        return result;
    }

    // Walk one directory at a time so a subtree that cannot be opened is
    // reported and skipped instead of ending the whole walk.
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        fs::directory_iterator it(dir, ec);
        if (ec) {
            const auto key = relativeKey(root, dir);
            result.errors.push_back({key.empty() ? dir.string() : key, ec.message()});
            Registry::index()->warn("[HashIndexer] Cannot open directory {}: {}", dir.string(), ec.message());
            ec.clear();
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                result.errors.push_back({relativeKey(root, dir), ec.message()});
                Registry::index()->warn("[HashIndexer] Directory listing of {} interrupted: {}", dir.string(), ec.message());
                ec.clear();
                break;
            }

            const auto& entry = *it;
            std::error_code sec;

            // Directory symlinks are not followed; file symlinks are hashed by target content.
            if (entry.is_directory(sec) && !entry.is_symlink(sec)) {
                pending.push_back(entry.path());
                continue;
            }
            if (!entry.is_regular_file(sec)) continue;

            auto key = relativeKey(root, entry.path());
            if (exclude && exclude->contains(key)) {
                ++result.skipped;
                continue;
            }

            try {
                result.hashes.emplace(std::move(key), digest(entry.path()));
            } catch (const std::exception& e) {
                Registry::index()->warn("[HashIndexer] {}", e.what());
                result.errors.push_back({relativeKey(root, entry.path()), e.what()});
            }
        }
    }

    Registry::index()->debug("[HashIndexer] Indexed {} files under {} ({} skipped, {} errors)",
                             result.hashes.size(), root.string(), result.skipped, result.errors.size());
    return result;
}

namespace hm::index {

IndexResult buildHashMap(const fs::path& root, const crypto::hash::Algorithm algo) {
    return HashIndexer(algo).build(root);
}

}
