#include "hashmirror/log/Rotator.hpp"

#include <limits>
#include <sstream>
#include <system_error>

using namespace hm::log;

Rotator::Rotator(Options opts)
    : opts_(std::move(opts)) {
    if (opts_.active_path.empty())
        throw std::invalid_argument("Rotator: active_path is empty.");

    dir_  = opts_.active_path.parent_path();
    base_ = opts_.active_path.stem().string();      // e.g. "hash_verification_log"
    ext_  = opts_.active_path.extension().string(); // e.g. ".txt"
}

bool Rotator::needsRotation() const {
    if (!opts_.max_bytes) return false;

    std::error_code ec;
    if (!std::filesystem::exists(opts_.active_path, ec) || ec) return false; // nothing to rotate

    const auto size = std::filesystem::file_size(opts_.active_path, ec);
    return !ec && size >= *opts_.max_bytes;
}

std::optional<std::filesystem::path> Rotator::maybeRotate() const {
    if (!needsRotation()) return std::nullopt;
    return rotateImpl();
}

std::optional<std::filesystem::path> Rotator::forceRotate() const {
    std::error_code ec;
    if (!std::filesystem::exists(opts_.active_path, ec)) return std::nullopt;
    return rotateImpl();
}

std::filesystem::path Rotator::archivePath(const unsigned int n) const {
    return dir_ / (base_ + "-" + std::to_string(n) + ext_);
}

std::filesystem::path Rotator::nextArchivePath() const {
    for (unsigned int n = 1; n < std::numeric_limits<unsigned int>::max(); ++n) {
        const auto candidate = archivePath(n);
        std::error_code ec;
        const bool taken = std::filesystem::exists(candidate, ec);
        // A stat failure other than not-found (e.g. ENAMETOOLONG) repeats for every n.
        if (ec) throw RotationError(opts_.active_path, candidate, ec.message());
        if (!taken) return candidate;
    }
    throw RotationError(opts_.active_path, archivePath(std::numeric_limits<unsigned int>::max()),
                        "no free archive name");
}

std::filesystem::path Rotator::rotateImpl() const {
    const auto target = nextArchivePath();

    std::error_code ec;
    std::filesystem::rename(opts_.active_path, target, ec);
    if (ec) {
        if (opts_.diag_log) opts_.diag_log(std::string("rotate: rename failed: ") + ec.message());
        throw RotationError(opts_.active_path, target, ec.message());
    }

    if (opts_.on_reopen) opts_.on_reopen();

    if (opts_.diag_log) {
        std::ostringstream os;
        os << "rotate: " << opts_.active_path.filename().string() << " -> " << target.filename().string();
        opts_.diag_log(os.str());
    }

    return target;
}

namespace hm::log {

std::optional<std::filesystem::path> rotateIfNeeded(const std::filesystem::path& logPath, const std::uint64_t maxSizeBytes) {
    return Rotator(Rotator::Options{
        .active_path = logPath,
        .max_bytes = maxSizeBytes,
    }).maybeRotate();
}

}
