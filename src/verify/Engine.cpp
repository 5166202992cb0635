#include "hashmirror/verify/Engine.hpp"
#include "hashmirror/checkpoint/Store.hpp"
#include "hashmirror/index/HashIndexer.hpp"
#include "hashmirror/log/HashLog.hpp"
#include "hashmirror/log/Registry.hpp"
#include "hashmirror/util/errors.hpp"

#include <algorithm>
#include <future>
#include <fmt/core.h>

using namespace hm::verify;
using namespace hm::index;
using namespace hm::checkpoint;
using namespace hm::log;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> sortedKeys(const PathHashMap& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [rel, _] : map) keys.push_back(rel);
    std::ranges::sort(keys);
    return keys;
}

}

Engine::Engine(Options opts) : opts_(std::move(opts)) {}

Report Engine::run() const {
    requireReadableSource(opts_.source_root);

    Registry::verify()->info("[Engine] Verifying {} against {} ({})",
                             opts_.source_root.string(), opts_.dest_root.string(),
                             crypto::hash::toString(opts_.algorithm));

    Report report;
    HashLog hashLog(opts_.log_path, opts_.max_log_bytes);
    hashLog.rotateIfNeeded();

    Store store(opts_.checkpoint_path);
    const auto& done = store.load();

    std::error_code ec;
    if (!fs::is_directory(opts_.dest_root, ec))
        Registry::verify()->warn("[Engine] Destination {} is missing; every unverified file will be reported missing",
                                 opts_.dest_root.string());

    // Checkpointed paths are excluded from both walks so their content is never read again.
    const HashIndexer indexer(opts_.algorithm, opts_.hasher);
    IndexResult src, dst;
    if (opts_.parallel_index) {
        auto srcFuture = std::async(std::launch::async, [&] { return indexer.build(opts_.source_root, &done); });
        auto dstFuture = std::async(std::launch::async, [&] { return indexer.build(opts_.dest_root, &done); });
        src = srcFuture.get();
        dst = dstFuture.get();
    } else {
        src = indexer.build(opts_.source_root, &done);
        dst = indexer.build(opts_.dest_root, &done);
    }

    report.skipped = src.skipped;

    // A failure on the destination root itself is recorded under its full path; file it under "".
    FailureMap dstFailures;
    for (const auto& [rel, message] : dst.errors)
        dstFailures.emplace(rel == opts_.dest_root.string() ? std::string{} : rel, message);

    const auto record = [&](const Outcome outcome, const std::string& rel, const std::string& detail = {}) {
        const auto line = logLine(outcome, rel);
        switch (outcome) {
            case Outcome::Verified:
                ++report.verified;
                Registry::verify()->debug("[Engine] {}", line);
                break;
            case Outcome::Mismatch:
                ++report.mismatched;
                report.errors.push_back(detail.empty() ? line : fmt::format("{} ({})", line, detail));
                Registry::verify()->warn("[Engine] {}", report.errors.back());
                break;
            case Outcome::MissingInDestination:
                ++report.missing;
                report.errors.push_back(line);
                Registry::verify()->warn("[Engine] {}", line);
                break;
        }
        hashLog.append(line);
    };

    for (const auto& rel : sortedKeys(src.hashes)) {
        if (done.contains(rel)) continue;

        const auto it = dst.hashes.find(rel);
        if (it == dst.hashes.end()) {
            if (const auto failed = coveringFailure(dstFailures, rel))
                record(Outcome::Mismatch, rel, "destination unreadable: " + *failed);
            else
                record(Outcome::MissingInDestination, rel);
            continue;
        }

        if (it->second != src.hashes.at(rel)) {
            record(Outcome::Mismatch, rel);
            continue;
        }

        try {
            if (!store.add(rel)) ++report.checkpoint_failures;
        } catch (const std::runtime_error& e) {
            ++report.checkpoint_failures;
            Registry::checkpoint()->warn("[Engine] {}", e.what());
        }
        record(Outcome::Verified, rel);
    }

    for (const auto& [rel, message] : src.errors) {
        ++report.hash_failures;
        report.errors.push_back(fmt::format("Hash failure: {} ({})", rel, message));
        Registry::verify()->warn("[Engine] {}", report.errors.back());
        hashLog.append(fmt::format("Hash failure: {}", rel));
    }

    if (report.ok()) {
        hashLog.append(SUCCESS_LINE);
        Registry::verify()->info("[Engine] {} ({} verified, {} skipped from checkpoint)",
                                 SUCCESS_LINE, report.verified, report.skipped);
    } else {
        hashLog.append(FAILURE_BANNER);
        Registry::verify()->error("[Engine] {} {} mismatched, {} missing, {} unreadable",
                                  FAILURE_BANNER, report.mismatched, report.missing, report.hash_failures);
        for (const auto& err : report.errors) {
            hashLog.append(err);
            Registry::verify()->error("  {}", err);
        }
    }

    report.rotations = hashLog.rotations();
    report.rotation_failures = hashLog.rotationFailures();
    return report;
}

namespace hm::verify {

Report verify(const Options& opts) { return Engine(opts).run(); }

std::optional<std::string> coveringFailure(const FailureMap& failures, const std::string& rel) {
    if (failures.empty()) return std::nullopt;
    if (const auto it = failures.find(rel); it != failures.end()) return it->second;

    for (auto dir = fs::path(rel).parent_path(); ; dir = dir.parent_path()) {
        if (const auto it = failures.find(dir.string()); it != failures.end()) return it->second;
        if (dir.empty()) return std::nullopt;
    }
}

void requireReadableSource(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) throw SourceMissingError(root);

    // is_directory only needs the parent to be searchable; listing needs read access on root itself
    const fs::directory_iterator first(root, ec);
    if (ec) throw SourceMissingError(root, ec.message());
}

}
