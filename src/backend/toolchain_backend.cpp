#include <algorithm>
#include <filesystem>
#include <iterator>

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/Program.h>

#include "toolchain_backend.h"
#include "build/backend_config.h"
#include "driver/errors.h"
#include "logging.h"
#include "utils.h"

static void checkOutputDirectory(const std::string& outputFile) {
    auto directory = std::filesystem::path(outputFile).parent_path();
    std::error_code ec;
    if (!directory.empty() && !is_directory(directory, ec)) {
        throw IOError("cannot write " + outputFile + ": directory " + directory.string() + " is not accessible" +
                      (ec ? ": " + ec.message() : std::string()));
    }
}

ToolchainBackend::ToolchainBackend(const BackendConfig& config, Logger& logger): config(config), logger(logger) {
}

std::string ToolchainBackend::findTool(const std::string& name) const {
    if (name.find('/') != std::string::npos) {
        if (!llvm::sys::fs::can_execute(name)) {
            throw EnvironmentError("`" + name + "' is not an executable file");
        }
        return name;
    }
    auto found = llvm::sys::findProgramByName(name);
    if (!found) {
        throw EnvironmentError("cannot find `" + name + "' in PATH: " + found.getError().message());
    }
    return *found;
}

int ToolchainBackend::execute(const std::string& program, const std::vector<std::string>& commandLine) const {
    logger.debug(join(commandLine, " "));

    llvm::SmallVector<llvm::StringRef, 16> argRefs;
    for (const auto& arg: commandLine) {
        argRefs.push_back(arg);
    }

    std::string errMsg;
    bool executionFailed = false;
    int status = llvm::sys::ExecuteAndWait(program, argRefs, {}, {}, 0, 0, &errMsg, &executionFailed);
    if (executionFailed) {
        throw EnvironmentError("cannot run " + program + ": " + errMsg);
    }
    if (status < 0) {
        throw CompileError(program + " terminated abnormally: " + errMsg);
    }
    return status;
}

std::vector<std::string> ToolchainBackend::cxxCommandLine(const std::string& cxx,
                                                          const std::string& inputFile,
                                                          const std::string& outputFile,
                                                          const CompilerOptions& options) const {
    std::vector<std::string> commandLine{cxx};
    std::ranges::copy(flagsOf(options.cppflags), std::back_inserter(commandLine));
    std::ranges::copy(flagsOf(options.cxxflags), std::back_inserter(commandLine));
    std::ranges::copy(config.cflags, std::back_inserter(commandLine));
    commandLine.insert(commandLine.end(), {"-shared", "-fPIC", inputFile, "-o", outputFile});
    std::ranges::copy(flagsOf(options.ldflags), std::back_inserter(commandLine));
    std::ranges::copy(config.ldflags, std::back_inserter(commandLine));
    return commandLine;
}

std::vector<std::string> ToolchainBackend::translatorCommandLine(const std::string& translator,
                                                                 const std::string& inputFile,
                                                                 const std::string& cppFile,
                                                                 const bool rawTranslateOnly,
                                                                 const CompilerOptions& options) const {
    std::vector<std::string> commandLine{translator, inputFile, "-o", cppFile};
    if (rawTranslateOnly) {
        commandLine.push_back("--raw");
    }
    for (const auto& pass: flagsOf(options.opts)) {
        commandLine.push_back("-p");
        commandLine.push_back(pass);
    }
    return commandLine;
}

void ToolchainBackend::compileCxx(const std::string& inputFile,
                                  const std::string& outputFile,
                                  const CompilerOptions& options) {
    std::error_code ec;
    if (!is_regular_file(std::filesystem::path(inputFile), ec)) {
        throw IOError("cannot read " + inputFile + (ec ? ": " + ec.message() : std::string()));
    }
    checkOutputDirectory(outputFile);

    auto cxx = findTool(config.cxx);
    int status = execute(cxx, cxxCommandLine(cxx, inputFile, outputFile, options));
    if (status != 0) {
        throw CompileError("`" + config.cxx + "' exited with status " + std::to_string(status) +
                           " while compiling " + inputFile);
    }
}

void ToolchainBackend::translate(const std::string& inputFile,
                                 const std::string& cppFile,
                                 const bool rawTranslateOnly,
                                 const CompilerOptions& options) const {
    auto translator = findTool(config.translator);
    int status = execute(translator, translatorCommandLine(translator, inputFile, cppFile, rawTranslateOnly, options));
    if (status == TRANSLATOR_UNSUPPORTED_STATUS) {
        throw UnimplementedFeature("`" + config.translator + "' cannot translate a construct used in " + inputFile);
    }
    if (status != 0) {
        throw CompileError("`" + config.translator + "' exited with status " + std::to_string(status) +
                           " while translating " + inputFile);
    }
}

void ToolchainBackend::compileModule(const std::string& inputFile,
                                     const std::string& outputFile,
                                     const bool cppOnly,
                                     const bool rawTranslateOnly,
                                     const CompilerOptions& options) {
    checkOutputDirectory(outputFile);
    if (cppOnly) {
        translate(inputFile, outputFile, rawTranslateOnly, options);
        return;
    }

    llvm::SmallString<128> cppFile;
    auto moduleName = std::filesystem::path(inputFile).stem().string();
    if (auto ec = llvm::sys::fs::createTemporaryFile(moduleName, "cpp", cppFile)) {
        throw IOError("cannot create a temporary file for " + moduleName + ": " + ec.message());
    }
    llvm::FileRemover remover(cppFile);

    translate(inputFile, cppFile.str().str(), rawTranslateOnly, options);
    compileCxx(cppFile.str().str(), outputFile, options);
}
