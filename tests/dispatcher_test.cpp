#include <gtest/gtest.h>

#include "backend/toolchain_backend.h"
#include "build/backend_config.h"
#include "cli/cli.h"
#include "driver/dispatcher.h"
#include "driver/driver.h"
#include "driver/error_reporter.h"
#include "test_support.h"

class DispatcherTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeBackend backend;
    CapturedLog log;
    std::string pyFile;
    std::string cppFile;

    void SetUp() override {
        pyFile = dir.write("foo.py", "def foo(n):\n    return n * 2\n");
        cppFile = dir.write("bar.cpp", "int bar() { return 0; }\n");
    }

    RawArguments args(const std::vector<std::string>& argv) {
        auto parsed = parseArgs(argv);
        if (auto* err = std::get_if<DriverError>(&parsed)) {
            ADD_FAILURE() << err->message;
            return RawArguments{};
        }
        return std::get<RawArguments>(parsed);
    }

    std::variant<CompilationRequest, DriverError> prepare(const std::vector<std::string>& argv) {
        Dispatcher dispatcher(backend, log.logger);
        return dispatcher.prepare(args(argv));
    }

    ErrorKind prepareError(const std::vector<std::string>& argv) {
        auto prepared = prepare(argv);
        if (!std::holds_alternative<DriverError>(prepared)) {
            ADD_FAILURE() << "expected a validation error";
            return ERR_ARGUMENT;
        }
        return std::get<DriverError>(prepared).kind;
    }

    CompilationRequest request(const std::vector<std::string>& argv) {
        auto prepared = prepare(argv);
        if (auto* err = std::get_if<DriverError>(&prepared)) {
            ADD_FAILURE() << err->message;
            return CompilationRequest{};
        }
        return std::get<CompilationRequest>(prepared);
    }

    int run(const std::vector<std::string>& argv) {
        return runDriver(args(argv), backend, log.logger);
    }
};

TEST_F(DispatcherTest, MissingInput) {
    EXPECT_EQ(prepareError({dir.path("nope.py").string()}), ERR_INPUT_NOT_FOUND);
    EXPECT_EQ(run({dir.path("nope.py").string()}), EXIT_FAILED);
    EXPECT_TRUE(backend.calls.empty());
    EXPECT_NE(log.str().find("CRITICAL: input file `"), std::string::npos);
}

TEST_F(DispatcherTest, InputNameTooLongIsNotFound) {
    auto input = dir.path(std::string(300, 'a') + ".py").string();
    EXPECT_EQ(prepareError({input}), ERR_INPUT_NOT_FOUND);
    EXPECT_EQ(run({input}), EXIT_FAILED);
    EXPECT_TRUE(backend.calls.empty());
}

TEST_F(DispatcherTest, OutputDirectoryNameTooLongIsAnIOError) {
    BackendConfig config;
    ToolchainBackend toolchain(config, log.logger);
    auto output = (dir.path(std::string(300, 'd')) / "bar.so").string();
    EXPECT_EQ(runDriver(args({cppFile, "-o", output}), toolchain, log.logger), EXIT_FAILED);
    EXPECT_NE(log.str().find("CRITICAL: I/O error"), std::string::npos);
}

TEST_F(DispatcherTest, DirectoryIsNotAnInput) {
    std::filesystem::create_directory(dir.path("pkg.py"));
    EXPECT_EQ(prepareError({dir.path("pkg.py").string()}), ERR_INPUT_NOT_FOUND);
}

TEST_F(DispatcherTest, UnsupportedExtension) {
    auto txt = dir.write("foo.txt", "hello");
    EXPECT_EQ(prepareError({txt}), ERR_UNSUPPORTED_EXTENSION);
    EXPECT_EQ(run({txt}), EXIT_FAILED);
    EXPECT_TRUE(backend.calls.empty());
}

TEST_F(DispatcherTest, TranslatingCxxInputIsRejected) {
    EXPECT_EQ(prepareError({cppFile, "-E"}), ERR_INVALID_COMBINATION);
    EXPECT_EQ(prepareError({cppFile, "-e"}), ERR_INVALID_COMBINATION);
    EXPECT_EQ(run({cppFile, "-E"}), EXIT_FAILED);
    EXPECT_TRUE(backend.calls.empty());
    EXPECT_NE(log.str().find("CRITICAL: "), std::string::npos);
}

TEST_F(DispatcherTest, DerivedOutputPaths) {
    EXPECT_EQ(request({pyFile, "-E"}).outputFile, "foo.cpp");
    EXPECT_EQ(request({pyFile, "-e"}).outputFile, "foo.cpp");
    EXPECT_EQ(request({pyFile}).outputFile, std::string("foo.") + NATIVE_EXTENSION_SUFFIX);
    EXPECT_EQ(request({cppFile}).outputFile, std::string("bar.") + NATIVE_EXTENSION_SUFFIX);
#ifndef _WIN32
    EXPECT_EQ(request({pyFile}).outputFile, "foo.so");
#endif
}

TEST_F(DispatcherTest, ExplicitOutputPathIsKept) {
    auto out = dir.path("out.so").string();
    EXPECT_EQ(request({pyFile, "-o", out}).outputFile, out);
}

TEST_F(DispatcherTest, Modes) {
    EXPECT_EQ(request({pyFile}).mode, MODE_FULL_COMPILE);
    EXPECT_EQ(request({pyFile, "-E"}).mode, MODE_TRANSLATE_ONLY);
    EXPECT_EQ(request({pyFile, "-e"}).mode, MODE_TRANSLATE_ONLY_RAW);
}

TEST_F(DispatcherTest, RequestCarriesAssembledOptions) {
    auto req = request({pyFile, "-I/a", "-O3"});
    EXPECT_EQ(req.options.cppflags, FlagList{"-I/a"});
    EXPECT_EQ(req.options.cxxflags, FlagList{"-O3"});
}

TEST_F(DispatcherTest, CxxInputGoesToCompileCxx) {
    EXPECT_EQ(run({cppFile, "-DX"}), EXIT_OK);
    ASSERT_EQ(backend.calls.size(), 1u);
    EXPECT_EQ(backend.calls[0].entryPoint, "compileCxx");
    EXPECT_EQ(backend.calls[0].inputFile, cppFile);
    EXPECT_EQ(backend.calls[0].outputFile, std::string("bar.") + NATIVE_EXTENSION_SUFFIX);
    EXPECT_EQ(backend.calls[0].options.cppflags, FlagList{"-DX"});
}

TEST_F(DispatcherTest, ModuleInputGoesToCompileModule) {
    EXPECT_EQ(run({pyFile}), EXIT_OK);
    ASSERT_EQ(backend.calls.size(), 1u);
    EXPECT_EQ(backend.calls[0].entryPoint, "compileModule");
    EXPECT_FALSE(backend.calls[0].cppOnly);
    EXPECT_FALSE(backend.calls[0].rawTranslateOnly);
    EXPECT_EQ(backend.calls[0].options.cxxflags, FlagList{"-O2"});
}

TEST_F(DispatcherTest, TranslateOnlyFlagsReachTheBackend) {
    EXPECT_EQ(run({pyFile, "-E"}), EXIT_OK);
    EXPECT_EQ(run({pyFile, "-e"}), EXIT_OK);
    ASSERT_EQ(backend.calls.size(), 2u);
    EXPECT_TRUE(backend.calls[0].cppOnly);
    EXPECT_FALSE(backend.calls[0].rawTranslateOnly);
    EXPECT_TRUE(backend.calls[1].cppOnly);
    EXPECT_TRUE(backend.calls[1].rawTranslateOnly);
}

TEST_F(DispatcherTest, SuccessIsLoggedAtInfo) {
    EXPECT_EQ(run({pyFile, "-E"}), EXIT_OK);
    EXPECT_NE(log.str().find("INFO: generated foo.cpp"), std::string::npos);
}

TEST_F(DispatcherTest, BackendFailuresAreRecovered) {
    const std::vector<std::pair<FakeFailure, ErrorKind> > cases{
        {FAIL_COMPILE, ERR_COMPILE},
        {FAIL_ENVIRONMENT, ERR_ENVIRONMENT},
        {FAIL_IO, ERR_IO},
    };
    for (const auto& [failure, kind]: cases) {
        backend.failure = failure;
        Dispatcher dispatcher(backend, log.logger);
        auto err = dispatcher.dispatch(request({pyFile}));
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, kind);
        EXPECT_EQ(run({pyFile}), EXIT_FAILED);
    }
}

TEST_F(DispatcherTest, UnimplementedFeaturePropagates) {
    backend.failure = FAIL_UNIMPLEMENTED;
    Dispatcher dispatcher(backend, log.logger);
    EXPECT_THROW(dispatcher.dispatch(request({pyFile})), UnimplementedFeature);
}

TEST_F(DispatcherTest, UnimplementedFeatureIsLoggedThenRethrown) {
    backend.failure = FAIL_UNIMPLEMENTED;
    try {
        run({pyFile});
        FAIL() << "expected the fault to propagate";
    } catch (const UnimplementedFeature& err) {
        EXPECT_STREQ(err.what(), "generator expressions in default arguments");
    }
    EXPECT_NE(log.str().find("CRITICAL: "), std::string::npos);
    EXPECT_NE(log.str().find("generator expressions in default arguments"), std::string::npos);
}
