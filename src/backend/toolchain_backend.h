#pragma once

#include <string>
#include <vector>

#include "backend/backend.h"

class BackendConfig;
class Logger;

// Binds the backend entry points to external programs: a translator emitting C++
// and the host C++ compiler building the extension.
class ToolchainBackend : public Backend {
    const BackendConfig& config;
    Logger& logger;

    std::string findTool(const std::string& name) const;

    int execute(const std::string& program, const std::vector<std::string>& commandLine) const;

    void translate(const std::string& inputFile,
                   const std::string& cppFile,
                   bool rawTranslateOnly,
                   const CompilerOptions& options) const;

public:
    // Translator exit status for a construct it cannot translate
    static constexpr int TRANSLATOR_UNSUPPORTED_STATUS = 3;

    ToolchainBackend(const BackendConfig& config, Logger& logger);

    std::vector<std::string> cxxCommandLine(const std::string& cxx,
                                            const std::string& inputFile,
                                            const std::string& outputFile,
                                            const CompilerOptions& options) const;

    std::vector<std::string> translatorCommandLine(const std::string& translator,
                                                   const std::string& inputFile,
                                                   const std::string& cppFile,
                                                   bool rawTranslateOnly,
                                                   const CompilerOptions& options) const;

    void compileCxx(const std::string& inputFile,
                    const std::string& outputFile,
                    const CompilerOptions& options) override;

    void compileModule(const std::string& inputFile,
                       const std::string& outputFile,
                       bool cppOnly,
                       bool rawTranslateOnly,
                       const CompilerOptions& options) override;
};
