#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hm::log {

constexpr std::uint64_t operator"" _KiB(unsigned long long v) { return v * 1024ULL; }
constexpr std::uint64_t operator"" _MiB(unsigned long long v) { return v * 1024ULL * 1024ULL; }
constexpr std::uint64_t operator"" _GiB(unsigned long long v) { return v * 1024ULL * 1024ULL * 1024ULL; }

// Raised when the active file is over budget but could not be renamed aside.
class RotationError : public std::runtime_error {
public:
    RotationError(const std::filesystem::path& active, const std::filesystem::path& target, const std::string& why)
        : std::runtime_error("rotate: rename " + active.string() + " -> " + target.string() + " failed: " + why),
          active_(active), target_(target) {}

    [[nodiscard]] const std::filesystem::path& active() const noexcept { return active_; }
    [[nodiscard]] const std::filesystem::path& target() const noexcept { return target_; }

private:
    std::filesystem::path active_, target_;
};

class Rotator {
public:
    struct Options {
        // Active file, e.g. /var/log/hashmirror/hash_verification_log.txt
        std::filesystem::path active_path;

        // rotate when size >= max_bytes; unset disables rotation
        std::optional<std::uint64_t> max_bytes;

        // Invoked synchronously from maybeRotate()/forceRotate()
        std::function<void()> on_reopen = nullptr;                   // writer drops its handle to the renamed file
        std::function<void(std::string_view)> diag_log = nullptr;    // rename notices and failures
    };

    explicit Rotator(Options opts);

    // Renames the active file to the lowest free "<base>-<N><ext>" archive when it
    // has reached max_bytes. Returns the archive path, or nullopt if nothing rotated.
    std::optional<std::filesystem::path> maybeRotate() const;
    std::optional<std::filesystem::path> forceRotate() const;

    [[nodiscard]] bool needsRotation() const;
    [[nodiscard]] std::filesystem::path archivePath(unsigned int n) const;
    [[nodiscard]] std::filesystem::path nextArchivePath() const;

    [[nodiscard]] const std::filesystem::path& activePath() const { return opts_.active_path; }
    [[nodiscard]] std::optional<std::uint64_t> maxBytes() const { return opts_.max_bytes; }

private:
    Options opts_;
    std::filesystem::path dir_;
    std::string base_;
    std::string ext_;

    std::filesystem::path rotateImpl() const;
};

// One-shot form: rotate logPath if it is at or above maxSizeBytes.
std::optional<std::filesystem::path> rotateIfNeeded(const std::filesystem::path& logPath, std::uint64_t maxSizeBytes);

}
