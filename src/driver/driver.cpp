#include "driver.h"
#include "dispatcher.h"
#include "error_reporter.h"
#include "logging.h"

int runDriver(const RawArguments& args, Backend& backend, Logger& logger) {
    Dispatcher dispatcher(backend, logger);
    ErrorReporter reporter(logger);

    auto prepared = dispatcher.prepare(args);
    if (auto* err = std::get_if<DriverError>(&prepared)) {
        return reporter.report(*err);
    }
    const auto& request = std::get<CompilationRequest>(prepared);

    std::optional<DriverError> failure;
    try {
        failure = dispatcher.dispatch(request);
    } catch (const UnimplementedFeature& err) {
        reporter.reportUnimplemented(err);
        throw;
    }
    if (failure.has_value()) {
        return reporter.report(*failure);
    }

    logger.info("generated " + request.outputFile);
    return EXIT_OK;
}
