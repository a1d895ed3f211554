#pragma once

#include <string>

#include "build/compiler_options.h"

// Failures are reported by throwing one of the BackendError subclasses in driver/errors.h.
class Backend {
public:
    virtual ~Backend() = default;

    // Compiles an existing C++ translation unit into a native extension
    virtual void compileCxx(const std::string& inputFile,
                            const std::string& outputFile,
                            const CompilerOptions& options) = 0;

    // Translates a Python module to C++; unless cppOnly is set the result is compiled as well.
    // rawTranslateOnly leaves out the Python binding glue.
    virtual void compileModule(const std::string& inputFile,
                               const std::string& outputFile,
                               bool cppOnly,
                               bool rawTranslateOnly,
                               const CompilerOptions& options) = 0;
};
