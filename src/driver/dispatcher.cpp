#include <filesystem>

#include "dispatcher.h"
#include "backend/backend.h"
#include "cli/cli.h"
#include "logging.h"

bool CompilationRequest::isCxxInput() const {
    return std::filesystem::path(inputFile).extension() == ".cpp";
}

Dispatcher::Dispatcher(Backend& backend, Logger& logger): backend(backend), logger(logger) {
}

std::variant<CompilationRequest, DriverError> Dispatcher::prepare(const RawArguments& args) const {
    std::filesystem::path input(args.inputFile);
    std::error_code ec;
    if (!is_regular_file(input, ec)) {
        auto reason = ec ? " (" + ec.message() + ")" : std::string();
        return DriverError{ERR_INPUT_NOT_FOUND, "input file `" + args.inputFile + "' not found" + reason};
    }

    auto moduleName = input.stem().string();
    auto extension = input.extension().string();
    if (extension != ".py" && extension != ".cpp") {
        return DriverError{
            ERR_UNSUPPORTED_EXTENSION,
            "unsupported file extension '" + extension + "' for " + args.inputFile + "; expected .py or .cpp"
        };
    }

    CompilationRequest request;
    request.inputFile = args.inputFile;
    if (args.rawTranslateOnly) {
        request.mode = MODE_TRANSLATE_ONLY_RAW;
    } else if (args.translateOnly) {
        request.mode = MODE_TRANSLATE_ONLY;
    } else {
        request.mode = MODE_FULL_COMPILE;
    }

    if (args.outputFile.has_value()) {
        request.outputFile = *args.outputFile;
    } else {
        request.outputFile = moduleName + "." + (request.translateOnly() ? "cpp" : NATIVE_EXTENSION_SUFFIX);
    }

    if (extension == ".cpp" && request.translateOnly()) {
        return DriverError{
            ERR_INVALID_COMBINATION,
            args.inputFile + " is already a C++ file, it cannot be translated again (-E/-e)"
        };
    }

    request.options = assembleFlags(args);
    return request;
}

std::optional<DriverError> Dispatcher::dispatch(const CompilationRequest& request) {
    try {
        if (request.isCxxInput()) {
            logger.info("compiling C++ file " + request.inputFile + " into " + request.outputFile);
            backend.compileCxx(request.inputFile, request.outputFile, request.options);
        } else {
            logger.info("compiling module " + request.inputFile + " into " + request.outputFile);
            backend.compileModule(request.inputFile,
                                  request.outputFile,
                                  request.translateOnly(),
                                  request.mode == MODE_TRANSLATE_ONLY_RAW,
                                  request.options);
        }
    } catch (const CompileError& err) {
        return DriverError{ERR_COMPILE, err.what()};
    } catch (const EnvironmentError& err) {
        return DriverError{ERR_ENVIRONMENT, err.what()};
    } catch (const IOError& err) {
        return DriverError{ERR_IO, err.what()};
    }
    return std::nullopt;
}
