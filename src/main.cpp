#include <iostream>
#include <variant>

#include "backend/toolchain_backend.h"
#include "build/backend_config.h"
#include "cli/cli.h"
#include "driver/driver.h"
#include "driver/error_reporter.h"
#include "logging.h"

int main(const int argc, char* argv[]) {
    auto parsed = parseArgs(argc, argv);
    if (auto* err = std::get_if<DriverError>(&parsed)) {
        Logger logger(LOG_WARNING);
        return ErrorReporter(logger).report(*err);
    }
    const auto& args = std::get<RawArguments>(parsed);
    if (args.versionRequested) {
        std::cout << versionString() << std::endl;
        return EXIT_OK;
    }

    Logger logger(args.verbose ? LOG_DEBUG : LOG_WARNING);

    BackendConfig config;
    if (args.configFile.has_value()) {
        if (auto err = config.parseConfig(*args.configFile)) {
            return ErrorReporter(logger).report(*err);
        }
    }

    ToolchainBackend backend(config, logger);
    return runDriver(args, backend, logger);
}
