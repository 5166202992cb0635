#include "hashmirror/verify/Report.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace hm::verify {

std::string_view toString(const Outcome outcome) {
    switch (outcome) {
        case Outcome::Verified: return "verified";
        case Outcome::Mismatch: return "mismatch";
        case Outcome::MissingInDestination: return "missing_in_destination";
    }
    return "unknown";
}

std::string logLine(const Outcome outcome, const std::string_view rel) {
    switch (outcome) {
        case Outcome::Verified: return fmt::format("Verified: {}", rel);
        case Outcome::Mismatch: return fmt::format("Hash mismatch: {}", rel);
        case Outcome::MissingInDestination: return fmt::format("Missing in destination: {}", rel);
    }
    return fmt::format("Unknown outcome: {}", rel);
}

void to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"ok", r.ok()},
        {"verified", r.verified},
        {"mismatched", r.mismatched},
        {"missing", r.missing},
        {"skipped", r.skipped},
        {"hash_failures", r.hash_failures},
        {"checkpoint_failures", r.checkpoint_failures},
        {"rotations", r.rotations},
        {"rotation_failures", r.rotation_failures},
        {"errors", r.errors}
    };
}

}
