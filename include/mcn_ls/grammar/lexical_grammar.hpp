#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// Lexical grammar of the MCN-16 language as consumed by the editor's
// highlighter and indenter. The tables and patterns here are an external
// contract: the editor applies them verbatim.
// ---------------------------------------------------------------------------

constexpr const char* kLanguageId = "mcn-16";
constexpr const char* kTokenPostfix = ".mcn-16";

// Regex sources (ECMAScript syntax).
constexpr const char* kSymbolsPattern = R"([+\-*&|^]=?|!=|[=<>]=?)";
constexpr const char* kIncreaseIndentPattern =
    R"(^\s*(forever|else|(if|elif|elseif|while).*)\s*$)";
constexpr const char* kDecreaseIndentPattern = R"(^\s*(end)\s*$)";
constexpr const char* kOnEnterOpenerPattern =
    R"(^\s*(forever|else|(if|elif|elseif|while).*)$)";
constexpr const char* kOnEnterEndPattern = R"(^\s*(end)$)";

[[nodiscard]] const std::vector<std::string>& Keywords();
[[nodiscard]] const std::vector<std::string>& Operators();

[[nodiscard]] bool IsKeyword(std::string_view word);
[[nodiscard]] bool IsOperator(std::string_view text);

// Highlight classes, named as the editor's theme expects them.
enum class TokenClass {
    Keyword,
    Identifier,
    Operator,
    NumberHex,
    NumberBinary,
    Number,
    Comment,
    Parenthesis,
    Separator,
    Invalid,
};

[[nodiscard]] const char* TokenClassName(TokenClass token_class);

struct HighlightToken {
    TokenClass token_class = TokenClass::Invalid;
    std::string text;
    uint32_t line = 0;
    uint32_t column = 0;
};

// Split text into highlight tokens. Whitespace and ';' produce no tokens.
// Never fails: characters no rule accepts become single Invalid tokens.
[[nodiscard]] std::vector<HighlightToken> TokenizeForHighlight(std::string_view text);

enum class IndentAction {
    None,
    Indent,
    IndentOutdent,
    Outdent,
};

[[nodiscard]] const char* IndentActionName(IndentAction action);

// Indentation rules: the line after a block opener is indented, an `end`
// line is outdented.
[[nodiscard]] bool IncreasesIndent(std::string_view line);
[[nodiscard]] bool DecreasesIndent(std::string_view line);

// Action applied when Enter is pressed with before_text left of the cursor.
[[nodiscard]] IndentAction OnEnterAction(std::string_view before_text);

// Full descriptor: Monarch-shaped tokenizer plus language configuration.
[[nodiscard]] nlohmann::json GrammarToJson();

} // namespace mcn_ls
