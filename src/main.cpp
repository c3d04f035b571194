#include <mcn_ls/compiler/compiler.hpp>
#include <mcn_ls/config/config_loader.hpp>
#include <mcn_ls/core/log.hpp>
#include <mcn_ls/core/terminal.hpp>
#include <mcn_ls/core/version.hpp>
#include <mcn_ls/grammar/lexical_grammar.hpp>
#include <mcn_ls/lsp/compiler_adapter.hpp>
#include <mcn_ls/lsp/language_server.hpp>
#include <mcn_ls/lsp/stdio_transport.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

namespace {

using namespace mcn_ls;

constexpr int kExitSuccess = 0;

void PrintError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

Result<std::string, Error> ReadSource(const std::string& path) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return Result<std::string, Error>::Ok(buffer.str());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(
            Error{"ReadSource", "Cannot open " + path, ErrorCategory::Io});
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<std::string, Error>::Ok(std::move(text));
}

void InitLogging(const ServerConfig& config) {
    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (*file) {
            sink = std::make_unique<FileSink>(std::move(file));
        } else {
            std::cerr << "Warning: cannot open log file " << *config.log_file
                      << ", logging to stderr\n";
        }
    }
    if (!sink) {
        switch (config.log_format) {
            case LogFormat::Color:
                sink = std::make_unique<ColorConsoleSink>(!NoColorEnvSet() && IsStderrTty());
                break;
            case LogFormat::Plain:
                sink = std::make_unique<ConsoleSink>();
                break;
            case LogFormat::Json:
                sink = std::make_unique<JsonSink>(std::cerr);
                break;
        }
    }
    InitGlobalLogger(std::move(sink), config.log_level);
}

int RunServe(const ServerConfig& config) {
    Compiler compiler;
    StdioTransport transport(std::cin, std::cout, FrameLimitFor(config.max_source_bytes));
    LanguageServer server(CompilerAdapter(compiler, config.max_source_bytes),
                          [&transport]() { return transport.MakeOutboundHandles(); });
    return transport.Run(server);
}

int RunCompile(const ServerConfig& config, const std::string& path) {
    auto source = ReadSource(path);
    if (source.IsErr()) {
        PrintError(source.Error());
        return source.Error().ExitCode();
    }

    Compiler compiler;
    CompilerAdapter adapter(compiler, config.max_source_bytes);
    auto assembly = adapter.CompileDirect(source.Value());
    if (assembly.IsErr()) {
        const Error error{"Compile", assembly.Error().summary, ErrorCategory::Compile};
        PrintError(error);
        return error.ExitCode();
    }
    std::cout << assembly.Value();
    return kExitSuccess;
}

int RunTokenize(const std::string& path) {
    auto source = ReadSource(path);
    if (source.IsErr()) {
        PrintError(source.Error());
        return source.Error().ExitCode();
    }
    for (const auto& token : TokenizeForHighlight(source.Value())) {
        std::cout << (token.line + 1) << ":" << (token.column + 1) << " "
                  << TokenClassName(token.token_class) << " " << token.text << "\n";
    }
    return kExitSuccess;
}

int RunGrammar() {
    std::cout << GrammarToJson().dump(2) << "\n";
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcn_ls;

    auto invocation = ParseCommandLine(argc, argv);
    if (invocation.IsErr()) {
        PrintError(invocation.Error());
        return invocation.Error().ExitCode();
    }
    if (invocation.Value().show_version) {
        std::cout << "mcn-ls " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config = ResolveConfig(invocation.Value());
    if (config.IsErr()) {
        PrintError(config.Error());
        return config.Error().ExitCode();
    }
    InitLogging(config.Value());
    LogDebug("cli", std::string("Log level ") + LogLevelName(config.Value().log_level) +
                        ", format " + LogFormatName(config.Value().log_format));

    switch (invocation.Value().subcommand) {
        case Subcommand::Serve:
            return RunServe(config.Value());
        case Subcommand::Compile:
            return RunCompile(config.Value(), invocation.Value().input_path);
        case Subcommand::Tokenize:
            return RunTokenize(invocation.Value().input_path);
        case Subcommand::Grammar:
            return RunGrammar();
    }
    return kExitSuccess;
}
