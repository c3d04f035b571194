#pragma once

#include <mcn_ls/compiler/token.hpp>
#include <mcn_ls/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcn_ls {

using CompileOutcome = Result<std::string, std::vector<CompileError>>;

// ---------------------------------------------------------------------------
// ICompiler: source text in, assembly text or located errors out.
//
// Implementations are pure: the same source always yields the same outcome.
// The language server only sees this interface, so tests can substitute
// a MockCompiler.
// ---------------------------------------------------------------------------
class ICompiler {
public:
    virtual ~ICompiler() = default;

    [[nodiscard]] virtual CompileOutcome Compile(std::string_view source) const = 0;
};

// MCN-16 compiler: Tokenize -> Parse -> Generate -> FormatAssembly.
class Compiler : public ICompiler {
public:
    [[nodiscard]] CompileOutcome Compile(std::string_view source) const override;
};

} // namespace mcn_ls
