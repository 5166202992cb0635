#pragma once

#include "hashmirror/log/Rotator.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace hm::log {

/**
 * Append-only, line-oriented writer for the hash verification log.
 *
 * Every line is flushed as soon as it is written. Size is bounded by a Rotator
 * over the same path: callers check rotation before a pass and after each line.
 * A failed rotation is reported through the "verify" logger and counted, and
 * writing carries on into the over-size file.
 */
class HashLog {
public:
    HashLog(std::filesystem::path path, std::uint64_t maxBytes);
    ~HashLog();

    HashLog(const HashLog&) = delete;
    HashLog& operator=(const HashLog&) = delete;

    // Throws std::runtime_error if the file cannot be opened for append.
    void write(std::string_view line);

    // write() followed by rotateIfNeeded().
    void append(std::string_view line);

    // Returns true if the file was rotated.
    bool rotateIfNeeded();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] unsigned int rotations() const { return rotations_; }
    [[nodiscard]] unsigned int rotationFailures() const { return rotationFailures_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    Rotator rotator_;
    unsigned int rotations_ = 0;
    unsigned int rotationFailures_ = 0;

    void ensureOpen();
};

}
