#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>

#include <argparse/argparse.hpp>

#include "cli.h"
#include "utils.h"

static std::optional<DriverError> expandInto(const std::vector<std::string>& args,
                                             std::vector<std::filesystem::path>& active,
                                             std::vector<std::string>& expanded) {
    for (const auto& arg: args) {
        if (arg.empty() || arg.front() != RESPONSE_FILE_SIGIL) {
            expanded.push_back(arg);
            continue;
        }

        std::filesystem::path file(arg.substr(1));
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(file, ec);
        if (ec) {
            canonical = file;
        }
        if (std::ranges::find(active, canonical) != active.end()) {
            return DriverError{ERR_ARGUMENT, "response file " + file.string() + " includes itself"};
        }

        std::optional<std::string> contents;
        if (is_regular_file(file, ec)) {
            contents = readFile(file);
        }
        if (!contents.has_value()) {
            return DriverError{ERR_ARGUMENT, "cannot read response file " + file.string()};
        }

        active.push_back(canonical);
        if (auto err = expandInto(splitWhitespace(*contents), active, expanded)) {
            return err;
        }
        active.pop_back();
    }
    return std::nullopt;
}

std::variant<std::vector<std::string>, DriverError> expandResponseFiles(const std::vector<std::string>& args) {
    std::vector<std::filesystem::path> active;
    std::vector<std::string> expanded;
    if (auto err = expandInto(args, active, expanded)) {
        return *err;
    }
    return expanded;
}

std::vector<std::string> splitAttachedValues(const std::vector<std::string>& tokens) {
    std::vector<std::string> split;
    for (const auto& token: tokens) {
        if (token.size() > 2 && token[0] == '-' && VALUE_FLAGS.find(token[1]) != std::string_view::npos) {
            split.push_back(token.substr(0, 2));
            split.push_back(token.substr(2));
        } else {
            split.push_back(token);
        }
    }
    return split;
}

static FlagList valuesOf(const argparse::ArgumentParser& program, const std::string& flag) {
    return program.present<FlagList>(flag).value_or(FlagList{});
}

std::variant<RawArguments, DriverError> parseArgs(const std::vector<std::string>& args) {
    argparse::ArgumentParser program("pyxc", PYXC_VERSION, argparse::default_arguments::help);
    program.add_description("Compiles a Python module into a native extension, going through C++.");

    program.add_argument("input_file").help("the .py or .cpp file to compile");

    program.add_argument("-o").metavar("OUTPUT_FILE").help("path to the generated file");
    program.add_argument("-E").help("only translate to C++, do not compile").flag();
    program.add_argument("-e").help("like -E, without the Python binding glue").flag();
    program.add_argument("-f").metavar("FLAG").help("any compiler switch relevant to the C++ compiler").append();
    program.add_argument("-v").help("be more verbose").flag();
    program.add_argument("-p").metavar("PASS").help("any optimization pass to run").append();
    program.add_argument("-m").metavar("MACHINE").help("any machine flag relevant to the C++ compiler").append();
    program.add_argument("-I").metavar("INCLUDE_DIR").help("any include dir relevant to the C++ compiler").append();
    program.add_argument("-L").metavar("LIBRARY_DIR").help("any search dir relevant to the linker").append();
    program.add_argument("-D").metavar("MACRO_DEF").help("any macro definition relevant to the C++ compiler").append();
    program.add_argument("-O").metavar("LEVEL").help("optimization level for the C++ compiler (default: 2)").append();
    program.add_argument("-g").help("compile with debug information").flag();

    program.add_argument("--config").metavar("CONFIG_FILE").help("TOML file describing the C++ toolchain");
    bool versionRequested = false;
    program.add_argument("--version")
            .help("print version information and exit")
            .action([&](const auto&) { versionRequested = true; })
            .flag();

    auto expanded = expandResponseFiles(args);
    if (auto* err = std::get_if<DriverError>(&expanded)) {
        return *err;
    }
    auto& tokens = std::get<std::vector<std::string> >(expanded);

    std::vector<std::string> argv{"pyxc"};
    std::ranges::copy(splitAttachedValues(tokens), std::back_inserter(argv));

    try {
        program.parse_args(argv);
    } catch (const std::exception& err) {
        // --version stands on its own, the input file is not needed
        if (versionRequested) {
            RawArguments raw;
            raw.tokens = std::move(tokens);
            raw.versionRequested = true;
            return raw;
        }
        std::ostringstream usage;
        usage << err.what() << "\n" << program;
        return DriverError{ERR_ARGUMENT, usage.str()};
    }

    RawArguments raw;
    raw.tokens = std::move(tokens);
    raw.versionRequested = versionRequested;
    raw.inputFile = program.get("input_file");
    raw.outputFile = program.present("-o");
    raw.configFile = program.present("--config");

    raw.rawTranslateOnly = program.get<bool>("-e");
    raw.translateOnly = program.get<bool>("-E") || raw.rawTranslateOnly;
    raw.verbose = program.get<bool>("-v");
    raw.debugFlag = program.get<bool>("-g");

    raw.extraFflags = valuesOf(program, "-f");
    raw.opts = valuesOf(program, "-p");
    raw.extraMflags = valuesOf(program, "-m");
    raw.extraIflags = valuesOf(program, "-I");
    raw.extraLflags = valuesOf(program, "-L");
    raw.extraDflags = valuesOf(program, "-D");
    raw.extraOflags = program.present<FlagList>("-O").value_or(FlagList{"2"});
    return raw;
}

std::string versionString() {
    return std::string("pyxc ") + PYXC_VERSION;
}

std::variant<RawArguments, DriverError> parseArgs(const int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return parseArgs(args);
}
