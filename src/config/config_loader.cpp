#include <mcn_ls/config/config_loader.hpp>

#include <mcn_ls/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>

namespace mcn_ls {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

Error MakeUsageError(const std::string& message) {
    return Error{"CommandLine", message, ErrorCategory::Usage};
}

std::string ToLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

const char* LogFormatName(LogFormat format) {
    switch (format) {
        case LogFormat::Color: return "color";
        case LogFormat::Plain: return "plain";
        case LogFormat::Json:  return "json";
    }
    return "color";
}

std::optional<LogFormat> ParseLogFormat(std::string_view text) {
    const std::string lowered = ToLower(text);
    if (lowered == "color") return LogFormat::Color;
    if (lowered == "plain") return LogFormat::Plain;
    if (lowered == "json") return LogFormat::Json;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::BadFile&) {
        return Result<ServerConfig, Error>::Err(Error{
            "ConfigLoader", "Cannot open config file: " + std::string(file_path),
            ErrorCategory::Io});
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ServerConfig config;
    if (root.IsNull()) {
        return Result<ServerConfig, Error>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    try {
        if (root["log_level"]) {
            const auto text = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(text);
            if (!level) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + text));
            }
            config.log_level = *level;
        }
        if (root["log_format"]) {
            const auto text = root["log_format"].as<std::string>();
            auto format = ParseLogFormat(text);
            if (!format) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("Invalid log_format: " + text +
                                    " (expected color, plain or json)"));
            }
            config.log_format = *format;
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["max_source_bytes"]) {
            const auto bytes = root["max_source_bytes"].as<long long>();
            if (bytes < 0) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("max_source_bytes must not be negative"));
            }
            config.max_source_bytes = static_cast<size_t>(bytes);
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }

    for (const auto& entry : root) {
        const auto key = entry.first.as<std::string>();
        if (key != "log_level" && key != "log_format" && key != "log_file" &&
            key != "max_source_bytes") {
            LogWarn("config", "Ignoring unknown config key '" + key + "'");
        }
    }

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ParseCommandLine
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> ParseCommandLine(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcn-ls", kVersion, argparse::default_arguments::help);
    program.add_description("Language server and compiler front end for MCN-16.");

    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("Minimum log level: debug, info, warn, error");
    program.add_argument("--log-format")
        .help("Log format on stderr: color, plain, json");
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file instead of stderr");
    program.add_argument("--max-source-bytes")
        .help("Refuse to compile documents larger than this")
        .scan<'i', long long>();

    argparse::ArgumentParser serve_cmd("serve", kVersion, argparse::default_arguments::help);
    serve_cmd.add_description("Run the language server on stdin/stdout (default).");

    argparse::ArgumentParser compile_cmd("compile", kVersion,
                                         argparse::default_arguments::help);
    compile_cmd.add_description("Compile a file to assembly.");
    compile_cmd.add_argument("input").help("Source file, or - for stdin");

    argparse::ArgumentParser tokenize_cmd("tokenize", kVersion,
                                          argparse::default_arguments::help);
    tokenize_cmd.add_description("Print the highlighting tokens of a file.");
    tokenize_cmd.add_argument("input").help("Source file, or - for stdin");

    argparse::ArgumentParser grammar_cmd("grammar", kVersion,
                                         argparse::default_arguments::help);
    grammar_cmd.add_description("Print the editor grammar as JSON.");

    program.add_subparser(serve_cmd);
    program.add_subparser(compile_cmd);
    program.add_subparser(tokenize_cmd);
    program.add_subparser(grammar_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;
    invocation.show_version = program.get<bool>("--version");

    if (program.is_subcommand_used("compile")) {
        invocation.subcommand = Subcommand::Compile;
        invocation.input_path = compile_cmd.get<std::string>("input");
    } else if (program.is_subcommand_used("tokenize")) {
        invocation.subcommand = Subcommand::Tokenize;
        invocation.input_path = tokenize_cmd.get<std::string>("input");
    } else if (program.is_subcommand_used("grammar")) {
        invocation.subcommand = Subcommand::Grammar;
    } else {
        invocation.subcommand = Subcommand::Serve;
    }

    if (auto val = program.present("--config")) {
        invocation.config_path = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliInvocation, Error>::Err(
                MakeUsageError("Invalid --log-level: " + *val));
        }
        invocation.overrides.log_level = *level;
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format) {
            return Result<CliInvocation, Error>::Err(
                MakeUsageError("Invalid --log-format: " + *val));
        }
        invocation.overrides.log_format = *format;
    }
    if (auto val = program.present("--log-file")) {
        invocation.overrides.log_file = *val;
    }
    if (auto val = program.present<long long>("--max-source-bytes")) {
        if (*val < 0) {
            return Result<CliInvocation, Error>::Err(
                MakeUsageError("--max-source-bytes must not be negative"));
        }
        invocation.overrides.max_source_bytes = static_cast<size_t>(*val);
    }

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// ApplyOverrides / ValidateConfig / ResolveConfig
// ---------------------------------------------------------------------------
ServerConfig ApplyOverrides(ServerConfig base, const ConfigOverrides& overrides) {
    if (overrides.log_level) {
        base.log_level = *overrides.log_level;
    }
    if (overrides.log_format) {
        base.log_format = *overrides.log_format;
    }
    if (overrides.log_file) {
        base.log_file = overrides.log_file;
    }
    if (overrides.max_source_bytes) {
        base.max_source_bytes = *overrides.max_source_bytes;
    }
    return base;
}

Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.max_source_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_source_bytes must be greater than zero"));
    }
    if (config.log_file && config.log_file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("log_file must not be empty"));
    }
    return Result<void, Error>::Ok();
}

Result<ServerConfig, Error> ResolveConfig(const CliInvocation& invocation) {
    ServerConfig base;
    if (invocation.config_path) {
        auto loaded = LoadFromYaml(*invocation.config_path);
        if (loaded.IsErr()) {
            return loaded;
        }
        base = std::move(loaded).Value();
    }

    ServerConfig config = ApplyOverrides(std::move(base), invocation.overrides);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<ServerConfig, Error>::Err(valid.Error());
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

} // namespace mcn_ls
