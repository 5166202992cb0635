#include "hashmirror/mirror/Invoker.hpp"
#include "hashmirror/log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace hm::mirror;
using namespace hm::log;

// rsync: partial transfer because source files vanished mid-run
static constexpr int RSYNC_VANISHED = 24;

Invoker::Invoker(Settings settings) : settings_(std::move(settings)) {}

std::vector<std::string> Invoker::buildArgs(const std::filesystem::path& source,
                                            const std::filesystem::path& dest,
                                            const std::filesystem::path& log_file) const {
    if (settings_.flavor == Flavor::Rsync) {
        // Trailing separator: copy the contents of source, not source itself
        auto src = source.string();
        if (src.empty() || src.back() != '/') src.push_back('/');
        return {
            "-r",                    // recursive
            "-t",                    // preserve modification times
            "--update",              // skip files that are newer on the receiver
            "--log-file=" + log_file.string(),
            src,
            dest.string()
        };
    }

    return {
        source.string(),
        dest.string(),
        "/E",                                                   // recurse, including empty directories
        "/COPY:DAT",                                            // data, attributes, timestamps
        "/DCOPY:T",                                             // directory timestamps
        fmt::format("/R:{}", settings_.retries),
        fmt::format("/W:{}", settings_.retry_wait_seconds),
        fmt::format("/IPG:{}", settings_.inter_packet_gap_ms),
        "/XO",                                                  // exclude older: copy only newer
        "/NDL",                                                 // no directory listing
        "/TEE",                                                 // console as well as log
        "/LOG+:" + log_file.string()
    };
}

Status Invoker::classify(const int exit_code) const {
    if (exit_code < 0) return Status::Failure;

    if (settings_.flavor == Flavor::Rsync) {
        if (exit_code == 0) return Status::Success;
        if (exit_code == RSYNC_VANISHED) return Status::SuccessWithWarnings;
        return Status::Failure;
    }

    // robocopy: 0 nothing to do, 1 files copied, 2 extra files, 3 both
    if (exit_code > settings_.success_threshold) return Status::Failure;
    if (exit_code <= 1) return Status::Success;
    return Status::SuccessWithWarnings;
}

Result Invoker::run(const std::filesystem::path& source,
                    const std::filesystem::path& dest,
                    const std::filesystem::path& log_file) const {
    const auto args = buildArgs(source, dest, log_file);
    Registry::mirror()->info("[Invoker] {} {}", settings_.program, fmt::join(args, " "));

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(settings_.program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    Result result;

    const pid_t pid = fork();
    if (pid < 0) {
        result.message = fmt::format("Failed to fork {}: {}", settings_.program, std::strerror(errno));
        Registry::mirror()->error("[Invoker] {}", result.message);
        return result;
    }

    if (pid == 0) {
        execvp(settings_.program.c_str(), argv.data());
        _exit(127); // exec failed
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        result.message = fmt::format("waitpid on {} failed: {}", settings_.program, std::strerror(errno));
        Registry::mirror()->error("[Invoker] {}", result.message);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.status = classify(result.exit_code);
        result.message = fmt::format("{} exited with status {} ({})",
                                     settings_.program, result.exit_code, toString(result.status));
    } else if (WIFSIGNALED(status)) {
        result.message = fmt::format("{} terminated by signal {}", settings_.program, WTERMSIG(status));
    } else {
        result.message = fmt::format("{} ended abnormally", settings_.program);
    }

    if (result.status == Status::Failure) Registry::mirror()->error("[Invoker] {}", result.message);
    else if (result.status == Status::SuccessWithWarnings) Registry::mirror()->warn("[Invoker] {}", result.message);
    else Registry::mirror()->info("[Invoker] {}", result.message);

    return result;
}

namespace hm::mirror {

std::string_view toString(const Flavor flavor) {
    switch (flavor) {
        case Flavor::Robocopy: return "robocopy";
        case Flavor::Rsync: return "rsync";
    }
    return "unknown";
}

std::optional<Flavor> parseFlavor(const std::string_view name) {
    if (name == "robocopy") return Flavor::Robocopy;
    if (name == "rsync") return Flavor::Rsync;
    return std::nullopt;
}

std::string_view toString(const Status status) {
    switch (status) {
        case Status::Success: return "success";
        case Status::SuccessWithWarnings: return "success with warnings";
        case Status::Failure: return "failure";
    }
    return "unknown";
}

}
