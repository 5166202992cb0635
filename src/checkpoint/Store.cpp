#include "hashmirror/checkpoint/Store.hpp"
#include "hashmirror/log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace hm::checkpoint;
using namespace hm::log;

namespace {

std::string trim(const std::string& s) {
    constexpr auto ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}

Store::Store(std::filesystem::path path) : path_(std::move(path)) {}

CheckpointSet Store::read(const std::filesystem::path& path) {
    CheckpointSet set;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return set;

    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open checkpoint file: " + path.string());

    std::string line;
    while (std::getline(in, line))
        if (auto rel = trim(line); !rel.empty()) set.insert(std::move(rel));

    return set;
}

void Store::append(const std::filesystem::path& path, const std::string_view rel) {
    if (const auto dir = path.parent_path(); !dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out) throw std::runtime_error("Failed to open checkpoint file for append: " + path.string());
    out << rel << '\n';
    out.flush();
    if (!out) throw std::runtime_error("Failed to append to checkpoint file: " + path.string());
}

const CheckpointSet& Store::load() {
    entries_ = read(path_);
    Registry::checkpoint()->debug("[Checkpoint] Loaded {} entries from {}", entries_.size(), path_.string());
    return entries_;
}

bool Store::add(const std::string& rel) {
    if (entries_.contains(rel)) return true;

    // One line per entry: a key with a line break would load back as unrelated fragments.
    if (rel.find_first_of("\r\n") != std::string::npos) {
        auto shown = rel;
        std::ranges::replace(shown, '\n', '?');
        std::ranges::replace(shown, '\r', '?');
        Registry::checkpoint()->warn("[Checkpoint] Not recording path containing a line break: {}", shown);
        return false;
    }

    append(path_, rel);
    entries_.insert(rel);
    return true;
}
