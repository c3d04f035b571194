#pragma once

#include <mcn_ls/core/log.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcn_ls {

constexpr size_t kDefaultMaxSourceBytes = 1024 * 1024;

enum class LogFormat {
    Color,  // ColorConsoleSink on stderr
    Plain,  // ConsoleSink on stderr
    Json,   // JsonSink on stderr
};

const char* LogFormatName(LogFormat format);
std::optional<LogFormat> ParseLogFormat(std::string_view text);

struct ServerConfig {
    LogLevel log_level = LogLevel::Warn;
    LogFormat log_format = LogFormat::Color;
    std::optional<std::string> log_file;  // JSON lines go here instead of stderr
    size_t max_source_bytes = kDefaultMaxSourceBytes;
};

// Values given on the command line. Set fields win over the YAML file.
struct ConfigOverrides {
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
    std::optional<size_t> max_source_bytes;
};

enum class Subcommand {
    Serve,
    Compile,
    Tokenize,
    Grammar,
};

struct CliInvocation {
    Subcommand subcommand = Subcommand::Serve;
    std::string input_path;  // compile / tokenize; "-" reads stdin
    std::optional<std::string> config_path;
    ConfigOverrides overrides;
    bool show_version = false;
};

} // namespace mcn_ls
