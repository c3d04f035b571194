#include <mcn_ls/compiler/compiler.hpp>

#include <mcn_ls/compiler/code_generator.hpp>
#include <mcn_ls/compiler/lexer.hpp>
#include <mcn_ls/compiler/parser.hpp>

namespace mcn_ls {

CompileOutcome Compiler::Compile(std::string_view source) const {
    return Tokenize(source)
        .AndThen([](const std::vector<Token>& tokens) { return Parse(tokens); })
        .AndThen([](const std::vector<Node>& program) { return Generate(program); })
        .Map([](const std::vector<Instruction>& code) { return FormatAssembly(code); });
}

} // namespace mcn_ls
