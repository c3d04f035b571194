#include <catch2/catch_test_macros.hpp>

#include "mocks/capture_sink.hpp"

#include <mcn_ls/config/config_loader.hpp>

#include <string>

using namespace mcn_ls;
using mcn_ls::testing::ScopedLogCapture;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from this
// file's location in the source tree.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);           // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.log_level == LogLevel::Debug);
    CHECK(config.log_format == LogFormat::Json);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/mcn-ls.log");
    CHECK(config.max_source_bytes == 4096);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Info);
    CHECK(result.Value().log_format == LogFormat::Color);
    CHECK_FALSE(result.Value().log_file.has_value());
    CHECK(result.Value().max_source_bytes == kDefaultMaxSourceBytes);
}

TEST_CASE("LoadFromYaml: empty file yields defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Io);
    CHECK(result.Error().message.find("Cannot open config file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid values", "[config][yaml]") {
    auto level = LoadFromYaml(TestDataPath("invalid_level.yaml"));
    REQUIRE(level.IsErr());
    CHECK(level.Error().category == ErrorCategory::Config);
    CHECK(level.Error().message == "Invalid log_level: loud");
    CHECK(level.Error().ExitCode() == 3);

    auto bytes = LoadFromYaml(TestDataPath("negative_bytes.yaml"));
    REQUIRE(bytes.IsErr());
    CHECK(bytes.Error().message == "max_source_bytes must not be negative");
}

TEST_CASE("LoadFromYaml: structural problems", "[config][yaml]") {
    auto sequence = LoadFromYaml(TestDataPath("not_a_map.yaml"));
    REQUIRE(sequence.IsErr());
    CHECK(sequence.Error().message == "Config root must be a mapping");

    auto malformed = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(malformed.IsErr());
    CHECK(malformed.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: unknown keys are warned about", "[config][yaml]") {
    ScopedLogCapture capture;
    auto result = LoadFromYaml(TestDataPath("unknown_key.yaml"));
    REQUIRE(result.IsOk());
    CHECK(capture.Sink().Contains("Ignoring unknown config key 'colour'"));
}

// ===========================================================================
// ParseCommandLine
// ===========================================================================

TEST_CASE("ParseCommandLine: no arguments serves", "[config][cli]") {
    const char* argv[] = {"mcn-ls"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = ParseCommandLine(argc, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().subcommand == Subcommand::Serve);
    CHECK_FALSE(result.Value().show_version);
    CHECK_FALSE(result.Value().config_path.has_value());
}

TEST_CASE("ParseCommandLine: compile with input", "[config][cli]") {
    const char* argv[] = {"mcn-ls", "compile", "blink.mcn"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = ParseCommandLine(argc, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().subcommand == Subcommand::Compile);
    CHECK(result.Value().input_path == "blink.mcn");
}

TEST_CASE("ParseCommandLine: tokenize and grammar", "[config][cli]") {
    const char* tokenize_argv[] = {"mcn-ls", "tokenize", "-"};
    auto tokenize = ParseCommandLine(3, tokenize_argv);
    REQUIRE(tokenize.IsOk());
    CHECK(tokenize.Value().subcommand == Subcommand::Tokenize);
    CHECK(tokenize.Value().input_path == "-");

    const char* grammar_argv[] = {"mcn-ls", "grammar"};
    auto grammar = ParseCommandLine(2, grammar_argv);
    REQUIRE(grammar.IsOk());
    CHECK(grammar.Value().subcommand == Subcommand::Grammar);
}

TEST_CASE("ParseCommandLine: global overrides", "[config][cli]") {
    const char* argv[] = {
        "mcn-ls",
        "--config", "server.yaml",
        "--log-level", "error",
        "--log-format", "plain",
        "--log-file", "out.log",
        "--max-source-bytes", "2048",
        "serve",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = ParseCommandLine(argc, argv);
    REQUIRE(result.IsOk());
    const auto& invocation = result.Value();
    CHECK(invocation.config_path == "server.yaml");
    CHECK(invocation.overrides.log_level == LogLevel::Error);
    CHECK(invocation.overrides.log_format == LogFormat::Plain);
    CHECK(invocation.overrides.log_file == "out.log");
    CHECK(invocation.overrides.max_source_bytes == size_t{2048});
}

TEST_CASE("ParseCommandLine: version flag", "[config][cli]") {
    const char* argv[] = {"mcn-ls", "--version"};
    auto result = ParseCommandLine(2, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("ParseCommandLine: invalid values are usage errors", "[config][cli]") {
    const char* level_argv[] = {"mcn-ls", "--log-level", "loud"};
    auto level = ParseCommandLine(3, level_argv);
    REQUIRE(level.IsErr());
    CHECK(level.Error().category == ErrorCategory::Usage);
    CHECK(level.Error().message == "Invalid --log-level: loud");

    const char* format_argv[] = {"mcn-ls", "--log-format", "xml"};
    auto format = ParseCommandLine(3, format_argv);
    REQUIRE(format.IsErr());
    CHECK(format.Error().ExitCode() == 2);

    const char* unknown_argv[] = {"mcn-ls", "--frobnicate"};
    auto unknown = ParseCommandLine(2, unknown_argv);
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// ApplyOverrides / ValidateConfig / ResolveConfig
// ===========================================================================

TEST_CASE("ApplyOverrides: set fields win", "[config][merge]") {
    ServerConfig base;
    base.log_level = LogLevel::Info;
    base.log_file = "base.log";

    ConfigOverrides overrides;
    overrides.log_level = LogLevel::Debug;

    auto merged = ApplyOverrides(base, overrides);
    CHECK(merged.log_level == LogLevel::Debug);
    CHECK(merged.log_file == "base.log");
    CHECK(merged.max_source_bytes == kDefaultMaxSourceBytes);
}

TEST_CASE("ValidateConfig: rejects impossible values", "[config][validate]") {
    ServerConfig config;
    CHECK(ValidateConfig(config).IsOk());

    config.max_source_bytes = 0;
    auto zero = ValidateConfig(config);
    REQUIRE(zero.IsErr());
    CHECK(zero.Error().message == "max_source_bytes must be greater than zero");

    config.max_source_bytes = 10;
    config.log_file = "";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ResolveConfig: command line overrides the YAML file", "[config][merge]") {
    CliInvocation invocation;
    invocation.config_path = TestDataPath("valid_config.yaml");
    invocation.overrides.log_format = LogFormat::Plain;

    auto result = ResolveConfig(invocation);
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Debug);
    CHECK(result.Value().log_format == LogFormat::Plain);
    CHECK(result.Value().max_source_bytes == 4096);
}

TEST_CASE("ResolveConfig: invalid override fails validation", "[config][merge]") {
    CliInvocation invocation;
    invocation.overrides.max_source_bytes = 0;

    auto result = ResolveConfig(invocation);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LogFormat: names round-trip case-insensitively", "[config]") {
    CHECK(ParseLogFormat("JSON") == LogFormat::Json);
    CHECK_FALSE(ParseLogFormat("yaml").has_value());
    CHECK(std::string(LogFormatName(LogFormat::Plain)) == "plain");
}
