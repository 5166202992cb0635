#include "hashmirror/log/HashLog.hpp"
#include "hashmirror/log/Registry.hpp"

#include <stdexcept>

using namespace hm::log;

HashLog::HashLog(std::filesystem::path path, const std::uint64_t maxBytes)
    : path_(std::move(path)),
      rotator_(Rotator::Options{
          .active_path = path_,
          .max_bytes = maxBytes,
          .on_reopen = [this]() { if (out_.is_open()) out_.close(); },
          .diag_log = [](const std::string_view msg) { Registry::verify()->debug("[HashLog] {}", msg); }
      }) {}

HashLog::~HashLog() {
    if (out_.is_open()) out_.close();
}

void HashLog::ensureOpen() {
    if (out_.is_open()) return;

    if (const auto dir = path_.parent_path(); !dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) throw std::runtime_error("Failed to open hash log for append: " + path_.string());
}

void HashLog::write(const std::string_view line) {
    ensureOpen();
    out_ << line << '\n';
    out_.flush();
    if (!out_) throw std::runtime_error("Failed to write to hash log: " + path_.string());
}

void HashLog::append(const std::string_view line) {
    write(line);
    rotateIfNeeded();
}

bool HashLog::rotateIfNeeded() {
    try {
        if (const auto archive = rotator_.maybeRotate()) {
            ++rotations_;
            Registry::verify()->info("[HashLog] Rotated {} -> {}", path_.filename().string(), archive->filename().string());
            return true;
        }
    } catch (const RotationError& e) {
        ++rotationFailures_;
        Registry::verify()->warn("[HashLog] {}; continuing without rotation", e.what());
    }
    return false;
}
