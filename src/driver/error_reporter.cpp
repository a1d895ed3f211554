#include <string>

#include "error_reporter.h"
#include "logging.h"

const char* errorKindName(const ErrorKind kind) {
    switch (kind) {
        case ERR_ARGUMENT:
            return "ArgumentError";
        case ERR_INPUT_NOT_FOUND:
            return "InputNotFound";
        case ERR_UNSUPPORTED_EXTENSION:
            return "UnsupportedExtension";
        case ERR_INVALID_COMBINATION:
            return "InvalidCombination";
        case ERR_COMPILE:
            return "CompileError";
        case ERR_ENVIRONMENT:
            return "EnvironmentError";
        case ERR_IO:
            return "IOError";
        case ERR_UNIMPLEMENTED:
            return "UnimplementedFeature";
    }
    return "UnknownError";
}

static std::string unimplementedMessage(const std::string& detail) {
    return "the translator hit a construct it does not support\nE: " + detail +
           "\nplease report this failure together with the input module";
}

ErrorReporter::ErrorReporter(Logger& logger): logger(logger) {
}

int ErrorReporter::report(const DriverError& error) {
    switch (error.kind) {
        case ERR_ARGUMENT:
            logger.error(error.message);
            return EXIT_USAGE;
        case ERR_INPUT_NOT_FOUND:
        case ERR_UNSUPPORTED_EXTENSION:
        case ERR_INVALID_COMBINATION:
            logger.critical(error.message);
            return EXIT_FAILED;
        case ERR_COMPILE:
            logger.critical("native compilation failed\nE: " + error.message);
            return EXIT_FAILED;
        case ERR_ENVIRONMENT:
            logger.critical("the compilation environment is incomplete\nE: " + error.message);
            return EXIT_FAILED;
        case ERR_IO:
            logger.critical("I/O error\nE: " + error.message);
            return EXIT_FAILED;
        case ERR_UNIMPLEMENTED:
            logger.critical(unimplementedMessage(error.message));
            throw UnimplementedFeature(error.message);
    }
    return EXIT_FAILED;
}

void ErrorReporter::reportUnimplemented(const UnimplementedFeature& error) {
    logger.critical(unimplementedMessage(error.what()));
}
