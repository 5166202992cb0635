#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hm::verify {

enum class Outcome { Verified, Mismatch, MissingInDestination };

inline constexpr std::string_view SUCCESS_LINE = "All files verified successfully.";
inline constexpr std::string_view FAILURE_BANNER = "Hash verification failed. Errors:";

struct Report {
    std::size_t verified = 0;
    std::size_t mismatched = 0;
    std::size_t missing = 0;
    std::size_t skipped = 0;              // already in the checkpoint
    std::size_t hash_failures = 0;        // source files that could not be hashed
    std::size_t checkpoint_failures = 0;
    std::size_t rotations = 0;
    std::size_t rotation_failures = 0;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const { return errors.empty(); }
    [[nodiscard]] std::size_t evaluated() const { return verified + mismatched + missing; }
};

std::string_view toString(Outcome outcome);

// "Verified: a.txt", "Hash mismatch: a.txt", "Missing in destination: a.txt"
std::string logLine(Outcome outcome, std::string_view rel);

void to_json(nlohmann::json& j, const Report& r);

}
