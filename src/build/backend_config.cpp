#include <sstream>

#include <toml++/toml.hpp>

#include "backend_config.h"

static std::optional<DriverError> readString(const toml::node_view<toml::node>& node,
                                             const std::string& key,
                                             std::string& target) {
    if (!node) {
        return std::nullopt;
    }
    auto value = node.value<std::string>();
    if (!value.has_value()) {
        return DriverError{ERR_ENVIRONMENT, "compiler." + key + " must be a string"};
    }
    target = *value;
    return std::nullopt;
}

static std::optional<DriverError> readFlags(const toml::node_view<toml::node>& node,
                                            const std::string& key,
                                            FlagList& target) {
    if (!node) {
        return std::nullopt;
    }
    auto* array = node.as_array();
    if (!array) {
        return DriverError{ERR_ENVIRONMENT, "compiler." + key + " must be an array of strings"};
    }
    FlagList flags;
    for (const auto& element: *array) {
        auto flag = element.value<std::string>();
        if (!flag.has_value()) {
            return DriverError{ERR_ENVIRONMENT, "compiler." + key + " must be an array of strings"};
        }
        flags.push_back(*flag);
    }
    target = std::move(flags);
    return std::nullopt;
}

std::optional<DriverError> BackendConfig::parseConfig(const std::filesystem::path& configFile) {
    std::error_code ec;
    if (!is_regular_file(configFile, ec)) {
        return DriverError{
            ERR_IO,
            "config file " + configFile.string() + " does not exist" + (ec ? ": " + ec.message() : std::string())
        };
    }

    toml::table config;
    try {
        config = toml::parse_file(configFile.string());
    } catch (const toml::parse_error& err) {
        std::ostringstream message;
        message << "error parsing " << configFile.string() << ": " << err;
        return DriverError{ERR_ENVIRONMENT, message.str()};
    }

    auto compiler = config["compiler"];
    if (!compiler) {
        return std::nullopt;
    }
    if (!compiler.is_table()) {
        return DriverError{ERR_ENVIRONMENT, "error parsing " + configFile.string() + ": compiler must be a table"};
    }

    if (auto err = readString(compiler["cxx"], "cxx", cxx)) {
        return err;
    }
    if (auto err = readString(compiler["translator"], "translator", translator)) {
        return err;
    }
    if (auto err = readFlags(compiler["cflags"], "cflags", cflags)) {
        return err;
    }
    return readFlags(compiler["ldflags"], "ldflags", ldflags);
}
