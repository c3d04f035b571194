#pragma once

#include <mcn_ls/config/app_config.hpp>
#include <mcn_ls/core/result.hpp>

#include <string_view>

namespace mcn_ls {

// Parse a YAML config file. Recognized keys: log_level, log_format,
// log_file, max_source_bytes. An empty file yields the defaults.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse argv into a subcommand plus configuration overrides.
Result<CliInvocation, Error> ParseCommandLine(int argc, const char* const* argv);

// Overrides take precedence over base.
ServerConfig ApplyOverrides(ServerConfig base, const ConfigOverrides& overrides);

Result<void, Error> ValidateConfig(const ServerConfig& config);

// LoadFromYaml (when a config path was given), ApplyOverrides, ValidateConfig.
Result<ServerConfig, Error> ResolveConfig(const CliInvocation& invocation);

} // namespace mcn_ls
