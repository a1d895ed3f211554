#pragma once

#include <optional>
#include <string>
#include <variant>

#include "build/compiler_options.h"
#include "driver/errors.h"

struct RawArguments;
class Backend;
class Logger;

enum CompileMode {
    MODE_TRANSLATE_ONLY,
    MODE_TRANSLATE_ONLY_RAW,
    MODE_FULL_COMPILE,
};

#ifdef _WIN32
inline constexpr const char* NATIVE_EXTENSION_SUFFIX = "pyd";
#else
inline constexpr const char* NATIVE_EXTENSION_SUFFIX = "so";
#endif

struct CompilationRequest {
    std::string inputFile;
    std::string outputFile;
    CompileMode mode;
    CompilerOptions options;

    bool translateOnly() const { return mode != MODE_FULL_COMPILE; }

    bool isCxxInput() const;
};

class Dispatcher {
    Backend& backend;
    Logger& logger;

public:
    Dispatcher(Backend& backend, Logger& logger);

    // Validates the input and settles the output path; makes no backend call
    std::variant<CompilationRequest, DriverError> prepare(const RawArguments& args) const;

    // UnimplementedFeature is left to propagate, every other backend failure is returned
    std::optional<DriverError> dispatch(const CompilationRequest& request);
};
