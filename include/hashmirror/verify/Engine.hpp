#pragma once

#include "hashmirror/crypto/hash.hpp"
#include "hashmirror/index/HashIndexer.hpp"
#include "hashmirror/verify/Report.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace hm::verify {

struct Options {
    std::filesystem::path source_root;
    std::filesystem::path dest_root;
    std::filesystem::path checkpoint_path;
    std::filesystem::path log_path;
    std::uint64_t max_log_bytes = 50 * 1024 * 1024;
    crypto::hash::Algorithm algorithm = crypto::hash::Algorithm::SHA256;
    bool parallel_index = false;    // hash source and destination trees concurrently
    index::HashIndexer::Hasher hasher = nullptr;    // overrides algorithm when set
};

/**
 * Confirms that every file under source_root exists under dest_root with the
 * same content hash, resuming from the checkpoint file.
 *
 * Checkpointed paths are neither hashed nor logged. Each remaining source file
 * yields exactly one outcome line in the hash log; verified paths are appended
 * to the checkpoint as they are confirmed. Files present only in the
 * destination are ignored.
 */
class Engine {
public:
    explicit Engine(Options opts);

    // Throws SourceMissingError before touching the log or checkpoint when
    // source_root is not a directory. Per-file problems land in the Report.
    Report run() const;

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    Options opts_;
};

Report verify(const Options& opts);

// relative key -> error message, for entries the indexer could not read; "" is the root
using FailureMap = std::unordered_map<std::string, std::string>;

// Message recorded for rel itself or for the nearest enclosing directory that could not be listed.
std::optional<std::string> coveringFailure(const FailureMap& failures, const std::string& rel);

// Throws SourceMissingError unless root is a directory whose entries can be listed.
void requireReadableSource(const std::filesystem::path& root);

}
