#include "compiler_options.h"
#include "cli/cli.h"

static void appendPrefixed(FlagList& flags, const std::string& prefix, const FlagList& values) {
    for (const auto& value: values) {
        flags.push_back(prefix + value);
    }
}

static std::optional<FlagList> nonEmpty(FlagList flags) {
    if (flags.empty()) {
        return std::nullopt;
    }
    return flags;
}

CompilerOptions assembleFlags(const RawArguments& args) {
    FlagList cppflags;
    appendPrefixed(cppflags, "-I", args.extraIflags);
    appendPrefixed(cppflags, "-D", args.extraDflags);

    FlagList cxxflags;
    appendPrefixed(cxxflags, "-O", args.extraOflags);
    appendPrefixed(cxxflags, "-m", args.extraMflags);
    appendPrefixed(cxxflags, "-f", args.extraFflags);
    if (args.debugFlag) {
        cxxflags.push_back("-g");
    }

    // Linker search directories are rendered with -f, not -L
    FlagList ldflags;
    appendPrefixed(ldflags, "-f", args.extraLflags);

    CompilerOptions options;
    options.cppflags = nonEmpty(std::move(cppflags));
    options.cxxflags = nonEmpty(std::move(cxxflags));
    options.ldflags = nonEmpty(std::move(ldflags));
    options.opts = nonEmpty(args.opts);
    return options;
}

const FlagList& flagsOf(const std::optional<FlagList>& category) {
    static const FlagList empty;
    return category.has_value() ? *category : empty;
}
