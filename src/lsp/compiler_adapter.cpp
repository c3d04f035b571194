#include <mcn_ls/lsp/compiler_adapter.hpp>

#include <mcn_ls/core/log.hpp>

#include <exception>

namespace mcn_ls {

namespace {

CompileResult InternalFailure(const std::string& message) {
    LogError("adapter", "Compiler fault: " + message);
    return CompileResult::Err(std::vector<Diagnostic>{
        Diagnostic{TextRange{}, DiagnosticSeverity::Error,
                   "Internal compiler error: " + message, kInternalSource}});
}

} // anonymous namespace

CompilerAdapter::CompilerAdapter(const ICompiler& compiler, size_t max_source_bytes)
    : compiler_(compiler), max_source_bytes_(max_source_bytes) {}

CompileResult CompilerAdapter::Compile(std::string_view source) const {
    if (source.size() > max_source_bytes_) {
        return CompileResult::Err(std::vector<Diagnostic>{Diagnostic{
            TextRange{}, DiagnosticSeverity::Error,
            "Document is too large to compile (" + std::to_string(source.size()) +
                " bytes, limit " + std::to_string(max_source_bytes_) + ")",
            kCompilerSource}});
    }

    try {
        auto outcome = compiler_.Compile(source);
        if (outcome.IsOk()) {
            return CompileResult::Ok(std::move(outcome).Value());
        }

        const auto errors = std::move(outcome).Error();
        if (errors.empty()) {
            return InternalFailure("compilation failed without reporting an error");
        }
        std::vector<Diagnostic> diagnostics;
        diagnostics.reserve(errors.size());
        for (const auto& error : errors) {
            diagnostics.push_back(Diagnostic{error.range, DiagnosticSeverity::Error,
                                             error.message, kCompilerSource});
        }
        return CompileResult::Err(std::move(diagnostics));
    } catch (const std::exception& e) {
        return InternalFailure(e.what());
    } catch (...) {
        // Non-standard throw from the engine: still a diagnostic, never a crash.
        return InternalFailure("unknown exception");
    }
}

Result<std::string, PreviewError> CompilerAdapter::CompileDirect(std::string_view source) const {
    auto result = Compile(source);
    if (result.IsOk()) {
        return Result<std::string, PreviewError>::Ok(std::move(result).Value());
    }

    const Diagnostic& first = result.Error().front();
    std::string summary;
    if (first.source == kInternalSource) {
        summary = first.message;
    } else {
        summary = "Compilation error at " + std::to_string(first.range.start.line + 1) + ":" +
                  std::to_string(first.range.start.character + 1) + ": " + first.message;
    }
    return Result<std::string, PreviewError>::Err(PreviewError{std::move(summary)});
}

} // namespace mcn_ls
