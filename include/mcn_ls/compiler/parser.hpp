#pragma once

#include <mcn_ls/compiler/ast.hpp>
#include <mcn_ls/compiler/token.hpp>
#include <mcn_ls/core/result.hpp>

#include <cstddef>
#include <initializer_list>
#include <vector>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// Parser: recursive descent over a token sequence produced by Tokenize().
//
// Precedence, lowest first:
//   assignment (right assoc.)  x = y = 1
//   compound assignment        x += 1
//   comparison                 a < b
//   additive                   + - & | ^
//   multiplicative             *
//   call / member              io.write(0, x)
//   primary                    number, name, debug, ( expr )
//
// A failing statement records its error and parsing resumes with the next
// token, so one pass reports every broken statement. Exceeding
// kMaxNestingDepth (parentheses, right-assoc. chains, nested blocks, or an
// operator chain whose tree grows that deep) ends the parse with one error.
// ---------------------------------------------------------------------------
constexpr size_t kMaxNestingDepth = 256;

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    [[nodiscard]] Result<std::vector<Node>, std::vector<CompileError>> ParseProgram();

private:
    using ParseResult = Result<Node, CompileError>;

    const Token& At() const;
    bool AtType(TokenType type) const { return At().type == type; }
    const Token& Eat();

    ParseResult ParseStatement();
    ParseResult ParseConditional();
    Result<Branch, CompileError> ParseBranch();
    ParseResult ParseEndless();
    ParseResult ParseWhile();
    ParseResult ParseUse();
    ParseResult ParseVarDeclaration();
    ParseResult ParseInlineDeclaration();

    // Statements until one of the terminators (or Eof) is reached.
    Result<Block, CompileError> ParseBody(std::initializer_list<TokenType> terminators,
                                          const TextRange& owner);
    Result<TextRange, CompileError> ExpectEnd(const TextRange& owner);

    ParseResult ParseExpression();
    ParseResult ParseAssignment();
    ParseResult ParseCompoundAssignment();
    ParseResult ParseComparison();
    ParseResult ParseAdditive();
    ParseResult ParseMultiplicative();
    ParseResult ParseCallMember();
    ParseResult ParseMember();
    ParseResult ParsePrimary();

    CompileError NestingError(const TextRange& range);

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;
    bool nesting_exceeded_ = false;
};

// Convenience wrapper: Parser(tokens).ParseProgram().
Result<std::vector<Node>, std::vector<CompileError>> Parse(std::vector<Token> tokens);

} // namespace mcn_ls
