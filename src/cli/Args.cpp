#include "hashmirror/cli/Args.hpp"

#include <cctype>
#include <limits>
#include <fmt/core.h>

using namespace hm::cli;

static constexpr std::uintmax_t KILOBYTE = 1024;
static constexpr std::uintmax_t MEGABYTE = KILOBYTE * KILOBYTE;
static constexpr std::uintmax_t GIGABYTE = KILOBYTE * MEGABYTE;

namespace {

ArgsParse invalid(std::string msg) {
    ArgsParse out;
    out.error = std::move(msg);
    return out;
}

// Splits "--key=value" into key and inline value.
std::pair<std::string, std::optional<std::string>> splitOption(const std::string& token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos) return {token, std::nullopt};
    return {token.substr(0, eq), token.substr(eq + 1)};
}

bool takesValue(const std::string& key) {
    return key == "--source" || key == "--dest" || key == "--log-dir" || key == "--algorithm" ||
           key == "--config" || key == "--report" || key == "--max-log-size";
}

}

namespace hm::cli {

std::optional<std::uintmax_t> parseSize(const std::string& s) {
    if (s.empty()) return std::nullopt;

    std::uintmax_t multiplier = 1;
    std::string digits = s;
    switch (std::toupper(static_cast<unsigned char>(s.back()))) {
        case 'K': multiplier = KILOBYTE; digits.pop_back(); break;
        case 'M': multiplier = MEGABYTE; digits.pop_back(); break;
        case 'G': multiplier = GIGABYTE; digits.pop_back(); break;
        default: break; // bytes
    }
    if (digits.empty()) return std::nullopt;

    std::uintmax_t v = 0;
    for (const char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto d = static_cast<std::uintmax_t>(c - '0');
        if (v > (std::numeric_limits<std::uintmax_t>::max() - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (v > std::numeric_limits<std::uintmax_t>::max() / multiplier) return std::nullopt;
    return v * multiplier;
}

std::optional<Command> parseCommand(const std::string_view name) {
    if (name == "run") return Command::Run;
    if (name == "mirror") return Command::Mirror;
    if (name == "verify") return Command::Verify;
    return std::nullopt;
}

std::string_view toString(const Command command) {
    switch (command) {
        case Command::Run: return "run";
        case Command::Mirror: return "mirror";
        case Command::Verify: return "verify";
    }
    return "unknown";
}

ArgsParse parseArgs(const std::vector<std::string>& argv) {
    ArgsParse out;
    auto& a = out.args;
    bool haveCommand = false;

    for (std::size_t i = 0; i < argv.size(); ++i) {
        const auto& token = argv[i];

        if (token == "-h" || token == "--help") { a.help = true; continue; }
        if (token == "--version") { a.version = true; continue; }
        if (token == "--parallel-index") { a.parallel_index = true; continue; }
        if (token == "--print-config") { a.print_config = true; continue; }

        if (token.starts_with("--")) {
            auto [key, value] = splitOption(token);
            if (!takesValue(key)) return invalid(fmt::format("unknown option '{}'", key));
            if (!value) {
                if (i + 1 >= argv.size()) return invalid(fmt::format("option '{}' requires a value", key));
                value = argv[++i];
            }
            if (value->empty()) return invalid(fmt::format("option '{}' requires a non-empty value", key));

            if (key == "--source") a.source = *value;
            else if (key == "--dest") a.dest = *value;
            else if (key == "--log-dir") a.log_dir = *value;
            else if (key == "--algorithm") a.algorithm = *value;
            else if (key == "--config") a.config = std::filesystem::path(*value);
            else if (key == "--report") a.report = std::filesystem::path(*value);
            else if (key == "--max-log-size") {
                const auto size = parseSize(*value);
                if (!size || *size == 0) return invalid(fmt::format("invalid size '{}' for --max-log-size", *value));
                a.max_log_size = size;
            }
            continue;
        }

        if (token.starts_with("-")) return invalid(fmt::format("unknown option '{}'", token));

        if (haveCommand) return invalid(fmt::format("unexpected argument '{}'", token));
        const auto cmd = parseCommand(token);
        if (!cmd) return invalid(fmt::format("unknown command '{}'", token));
        a.command = *cmd;
        haveCommand = true;
    }

    // Informational flags need no paths
    if (a.help || a.version || a.print_config) {
        out.ok = true;
        return out;
    }

    if (!haveCommand) return invalid("missing command (run, mirror or verify)");
    if (a.source.empty()) return invalid("--source is required");
    if (a.dest.empty()) return invalid("--dest is required");
    if (a.log_dir.empty()) return invalid("--log-dir is required");

    out.ok = true;
    return out;
}

std::string usage() {
    return
        "Usage: hashmirror <command> --source <dir> --dest <dir> --log-dir <dir> [options]\n"
        "\n"
        "Commands:\n"
        "  run                     Mirror the source tree, then verify the copy\n"
        "  mirror                  Run the copy tool only\n"
        "  verify                  Verify the destination against the source only\n"
        "\n"
        "Options:\n"
        "  --source <dir>          Tree to copy from (required)\n"
        "  --dest <dir>            Tree to copy to (required)\n"
        "  --log-dir <dir>         Directory for logs and the checkpoint file (required)\n"
        "  --algorithm <name>      sha256 (default) or blake2b\n"
        "  --config <file>         YAML config (default $HASHMIRROR_CONFIG or /etc/hashmirror/config.yaml)\n"
        "  --report <file>         Write the verification report as JSON\n"
        "  --max-log-size <size>   Rotate logs at this size; accepts K, M and G suffixes\n"
        "  --parallel-index        Hash the source and destination trees concurrently\n"
        "  --print-config          Print the effective configuration as JSON and exit\n"
        "  -h, --help              Show this help\n"
        "  --version               Show the version\n"
        "\n"
        "Exit status:\n"
        "  0  success\n"
        "  1  usage or fatal error\n"
        "  2  mirror failed, verification passed\n"
        "  3  verification found errors\n"
        "  4  mirror failed and verification found errors\n";
}

}
