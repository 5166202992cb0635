#include "hashmirror/cli/App.hpp"
#include "hashmirror/log/Registry.hpp"
#include "hashmirror/util/errors.hpp"

#include <iostream>
#include <string>
#include <vector>

#ifndef HASHMIRROR_VERSION
#define HASHMIRROR_VERSION "0.0.0"
#endif

using namespace hm::cli;
using namespace hm::log;

namespace {

int fatal(const std::string& msg) {
    if (Registry::isInitialized()) Registry::hashmirror()->error("[!] {}", msg);
    else std::cerr << "hashmirror: " << msg << std::endl;
    return EXIT_FATAL;
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> raw(argv + 1, argv + argc);
    const auto parsed = parseArgs(raw);

    if (!parsed.ok) {
        std::cerr << "hashmirror: " << parsed.error << "\n\n" << usage();
        return EXIT_FATAL;
    }

    if (parsed.args.help) {
        std::cout << usage();
        return EXIT_OK;
    }

    if (parsed.args.version) {
        std::cout << "hashmirror " << HASHMIRROR_VERSION << std::endl;
        return EXIT_OK;
    }

    try {
        App app(parsed.args);
        return app.run();
    } catch (const hm::SourceMissingError& e) {
        return fatal(e.what());
    } catch (const hm::ConfigError& e) {
        return fatal(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        return fatal(std::string("Fatal error: ") + e.what());
    }
}
