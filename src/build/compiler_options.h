#pragma once

#include <optional>
#include <string>
#include <vector>

struct RawArguments;

typedef std::vector<std::string> FlagList;

// A category is only set when it holds at least one flag; the backend applies
// its own defaults to categories that are absent.
struct CompilerOptions {
    std::optional<FlagList> cppflags;
    std::optional<FlagList> cxxflags;
    std::optional<FlagList> ldflags;
    std::optional<FlagList> opts;

    bool operator==(const CompilerOptions& other) const = default;
};

CompilerOptions assembleFlags(const RawArguments& args);

// Empty when the category is absent
const FlagList& flagsOf(const std::optional<FlagList>& category);
