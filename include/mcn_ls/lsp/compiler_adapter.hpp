#pragma once

#include <mcn_ls/compiler/compiler.hpp>
#include <mcn_ls/config/app_config.hpp>
#include <mcn_ls/core/result.hpp>
#include <mcn_ls/lsp/diagnostic.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcn_ls {

using CompileResult = Result<std::string, std::vector<Diagnostic>>;

// Caller-visible failure signal of the preview path. Carries a one-line
// summary only.
struct PreviewError {
    std::string summary;
};

// ---------------------------------------------------------------------------
// CompilerAdapter: wraps an ICompiler and contains its faults.
//
// Compile() never throws. Engine errors become Error diagnostics tagged with
// the compiler source; anything the engine throws becomes a single
// diagnostic tagged "internal". Sources larger than max_source_bytes are
// refused before reaching the engine.
// ---------------------------------------------------------------------------
class CompilerAdapter {
public:
    explicit CompilerAdapter(const ICompiler& compiler,
                             size_t max_source_bytes = kDefaultMaxSourceBytes);

    [[nodiscard]] CompileResult Compile(std::string_view source) const;

    // Stateless preview path: assembly text, or a summary of the first problem.
    [[nodiscard]] Result<std::string, PreviewError> CompileDirect(std::string_view source) const;

    [[nodiscard]] size_t MaxSourceBytes() const { return max_source_bytes_; }

private:
    const ICompiler& compiler_;
    size_t max_source_bytes_;
};

} // namespace mcn_ls
