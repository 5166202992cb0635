#pragma once

#include "hashmirror/cli/Args.hpp"
#include "hashmirror/config/Config.hpp"


namespace hm::cli {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FATAL = 1,
    EXIT_MIRROR_FAILED = 2,
    EXIT_VERIFY_FAILED = 3,
    EXIT_BOTH_FAILED = 4
};

// Phases that did not run count as passed.
int exitCode(bool mirrorOk, bool verifyOk);

// Config file values with command-line overrides applied. Throws ConfigError
// for an unknown --algorithm.
config::Config effectiveConfig(const config::Config& base, const Args& args);

/**
 * Drives a whole invocation: loads the config, brings up logging, runs the
 * mirror and/or verify phase and maps the outcome onto an exit code.
 * Throws SourceMissingError and ConfigError; main turns those into EXIT_FATAL.
 */
class App {
public:
    explicit App(Args args);

    int run();

private:
    Args args_;
    config::Config config_;

    bool runMirror() const;
    bool runVerify() const;
};

}
