#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hm::cli {

enum class Command { Run, Mirror, Verify };

struct Args {
    Command command = Command::Run;

    std::filesystem::path source;
    std::filesystem::path dest;
    std::filesystem::path log_dir;

    // Overrides; unset means "take it from the config file"
    std::optional<std::string> algorithm;
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> report;
    std::optional<std::uintmax_t> max_log_size;
    bool parallel_index = false;

    bool print_config = false;
    bool help = false;
    bool version = false;
};

struct ArgsParse {
    bool ok = false;
    Args args;
    std::string error;
};

// argv without the program name
ArgsParse parseArgs(const std::vector<std::string>& argv);

// "1024", "64K", "50M", "2G"; nullopt on anything else or on overflow
std::optional<std::uintmax_t> parseSize(const std::string& s);

std::optional<Command> parseCommand(std::string_view name);
std::string_view toString(Command command);

std::string usage();

}
