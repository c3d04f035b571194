#pragma once

#include <mcn_ls/core/types.hpp>

#include <cstdint>
#include <string>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// CompileError: a problem found while compiling, located in the source.
// ---------------------------------------------------------------------------
struct CompileError {
    std::string message;
    TextRange range;

    bool operator==(const CompileError& other) const {
        return message == other.message && range == other.range;
    }
    bool operator!=(const CompileError& other) const { return !(*this == other); }
};

enum class TokenType {
    // Keywords
    Inline,
    If,
    Elif,       // also spelled "elseif"
    Else,
    Forever,
    While,
    End,
    Pass,
    Use,
    Var,
    Debug,
    // Values
    Identifier,
    Number,
    // Operators
    BinaryOperator,   // + - * & | ^
    CompoundAssign,   // += -= *= &= |= ^=
    Equals,           // =
    Comparison,       // == != < > <= >=
    // Punctuation
    OpenParen,
    OpenCallParen,    // '(' directly after an identifier
    CloseParen,
    Comma,
    Dot,
    Eof,
};

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    And,
    Or,
    Xor,
};

enum class CompareOp {
    Equal,
    NotEqual,
    Less,
    Greater,
    LessEqual,
    GreaterEqual,
};

struct Token {
    TokenType type = TokenType::Eof;
    std::string text;
    uint16_t number = 0;                    // TokenType::Number
    BinaryOp binary_op = BinaryOp::Add;     // BinaryOperator, CompoundAssign
    CompareOp compare_op = CompareOp::Equal;
    TextRange range;
};

[[nodiscard]] const char* TokenTypeName(TokenType type);

// Comparison that holds exactly when op does not.
[[nodiscard]] CompareOp Negate(CompareOp op);

[[nodiscard]] bool IsCommutative(BinaryOp op);

} // namespace mcn_ls
