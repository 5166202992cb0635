#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hm::mirror {

// Argument dialect of the external copy tool.
enum class Flavor { Robocopy, Rsync };

enum class Status { Success, SuccessWithWarnings, Failure };

struct Settings {
    std::string program = "robocopy";
    Flavor flavor = Flavor::Robocopy;
    unsigned int retries = 5;
    unsigned int retry_wait_seconds = 5;
    unsigned int inter_packet_gap_ms = 0;
    int success_threshold = 3;
};

struct Result {
    int exit_code = -1;     // -1 when the process could not be started or was signalled
    Status status = Status::Failure;
    std::string message;

    [[nodiscard]] bool succeeded() const { return status != Status::Failure; }
};

/**
 * Runs the copy tool once and classifies its exit status. The tool's output
 * goes straight to the console and is appended to log_file by the tool itself.
 */
class Invoker {
public:
    explicit Invoker(Settings settings);

    [[nodiscard]] std::vector<std::string> buildArgs(const std::filesystem::path& source,
                                                     const std::filesystem::path& dest,
                                                     const std::filesystem::path& log_file) const;

    [[nodiscard]] Status classify(int exit_code) const;

    // Never throws for tool failures; launch problems come back as Status::Failure.
    Result run(const std::filesystem::path& source,
               const std::filesystem::path& dest,
               const std::filesystem::path& log_file) const;

    [[nodiscard]] const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

std::string_view toString(Flavor flavor);
std::optional<Flavor> parseFlavor(std::string_view name);
std::string_view toString(Status status);

}
