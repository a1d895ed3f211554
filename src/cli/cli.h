#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "build/compiler_options.h"
#include "driver/errors.h"

inline constexpr char RESPONSE_FILE_SIGIL = '@';

// Short flags that take a value, accepted both as "-I dir" and "-Idir"
inline constexpr std::string_view VALUE_FLAGS = "oIDLOfmp";

struct RawArguments {
    // argument tokens after response file expansion, program name excluded
    std::vector<std::string> tokens;

    std::string inputFile;
    std::optional<std::string> outputFile;
    std::optional<std::string> configFile;

    bool translateOnly = false;
    bool rawTranslateOnly = false;
    bool verbose = false;
    bool debugFlag = false;
    // set by --version; nothing else needs to be valid then
    bool versionRequested = false;

    FlagList extraFflags;
    FlagList opts;
    FlagList extraMflags;
    FlagList extraIflags;
    FlagList extraLflags;
    FlagList extraDflags;
    FlagList extraOflags;
};

std::variant<std::vector<std::string>, DriverError> expandResponseFiles(const std::vector<std::string>& args);

std::string versionString();

std::vector<std::string> splitAttachedValues(const std::vector<std::string>& tokens);

// args excludes the program name
std::variant<RawArguments, DriverError> parseArgs(const std::vector<std::string>& args);

std::variant<RawArguments, DriverError> parseArgs(int argc, char* argv[]);
