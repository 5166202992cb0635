#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace hm {

// The source tree cannot be read at all; nothing is mirrored or verified.
class SourceMissingError : public std::runtime_error {
public:
    explicit SourceMissingError(const std::filesystem::path& root)
        : std::runtime_error("Source path does not exist or is not a directory: " + root.string()),
          root_(root) {}

    SourceMissingError(const std::filesystem::path& root, const std::string& why)
        : std::runtime_error("Cannot read source directory " + root.string() + ": " + why),
          root_(root) {}

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
