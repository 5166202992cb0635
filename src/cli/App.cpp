#include "hashmirror/cli/App.hpp"
#include "hashmirror/config/ConfigRegistry.hpp"
#include "hashmirror/log/Registry.hpp"
#include "hashmirror/log/Rotator.hpp"
#include "hashmirror/mirror/Invoker.hpp"
#include "hashmirror/verify/Engine.hpp"
#include "hashmirror/util/errors.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace hm::cli;
using namespace hm::config;
using namespace hm::log;

namespace hm::cli {

int exitCode(const bool mirrorOk, const bool verifyOk) {
    if (mirrorOk && verifyOk) return EXIT_OK;
    if (!mirrorOk && !verifyOk) return EXIT_BOTH_FAILED;
    return mirrorOk ? EXIT_VERIFY_FAILED : EXIT_MIRROR_FAILED;
}

Config effectiveConfig(const Config& base, const Args& args) {
    Config cfg = base;

    if (args.algorithm) {
        const auto algo = crypto::hash::parseAlgorithm(*args.algorithm);
        if (!algo) throw ConfigError("--algorithm: unsupported hash algorithm '" + *args.algorithm + "'");
        cfg.verify.algorithm = *algo;
    }

    if (args.max_log_size) {
        cfg.verify.max_log_size_bytes = *args.max_log_size;
        cfg.mirror.max_log_size_bytes = *args.max_log_size;
    }

    if (args.parallel_index) cfg.verify.parallel_index = true;

    return cfg;
}

}

App::App(Args args) : args_(std::move(args)) {}

int App::run() {
    if (args_.config) ConfigRegistry::init(*args_.config);
    else ConfigRegistry::init();

    config_ = effectiveConfig(ConfigRegistry::get(), args_);

    if (args_.print_config) {
        std::cout << nlohmann::json(config_).dump(2) << std::endl;
        return EXIT_OK;
    }

    verify::requireReadableSource(args_.source);

    Registry::init(args_.log_dir);
    Registry::hashmirror()->info("[App] {} {} -> {} (logs in {})", toString(args_.command),
                                 args_.source.string(), args_.dest.string(), args_.log_dir.string());

    bool mirrorOk = true;
    if (args_.command != Command::Verify) mirrorOk = runMirror();

    bool verifyOk = true;
    if (args_.command != Command::Mirror) {
        if (!mirrorOk) Registry::hashmirror()->warn("[App] Mirror failed; verifying whatever reached the destination");
        verifyOk = runVerify();
    }

    const int code = exitCode(mirrorOk, verifyOk);
    Registry::hashmirror()->info("[App] Finished with exit status {}", code);
    return code;
}

bool App::runMirror() const {
    const auto logFile = args_.log_dir / config_.mirror.log_name;

    // The copy tool appends to its own log; keep it bounded the same way as the hash log.
    try {
        if (const auto archived = rotateIfNeeded(logFile, config_.mirror.max_log_size_bytes))
            Registry::mirror()->info("[App] Rotated {} to {}", logFile.string(), archived->string());
    } catch (const RotationError& e) {
        Registry::mirror()->warn("[App] {}", e.what());
    }

    const mirror::Invoker invoker(config_.mirror.tool);
    return invoker.run(args_.source, args_.dest, logFile).succeeded();
}

bool App::runVerify() const {
    verify::Options opts;
    opts.source_root = args_.source;
    opts.dest_root = args_.dest;
    opts.checkpoint_path = args_.log_dir / config_.verify.checkpoint_name;
    opts.log_path = args_.log_dir / config_.verify.log_name;
    opts.max_log_bytes = config_.verify.max_log_size_bytes;
    opts.algorithm = config_.verify.algorithm;
    opts.parallel_index = config_.verify.parallel_index;

    const auto report = verify::verify(opts);

    if (args_.report) {
        std::ofstream out(*args_.report, std::ios::trunc);
        if (!out) Registry::hashmirror()->error("[App] Cannot write report to {}", args_.report->string());
        else {
            out << nlohmann::json(report).dump(2) << '\n';
            Registry::hashmirror()->info("[App] Report written to {}", args_.report->string());
        }
    }

    return report.ok();
}
