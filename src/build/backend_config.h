#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "build/compiler_options.h"
#include "driver/errors.h"

class BackendConfig {
public:
    std::string cxx = "c++";
    std::string translator = "pyxc-translate";

    FlagList cflags;
    FlagList ldflags;

    // Reads the [compiler] table; keys that are absent keep their defaults
    std::optional<DriverError> parseConfig(const std::filesystem::path& configFile);
};
