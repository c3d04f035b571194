#include <mcn_ls/grammar/lexical_grammar.hpp>

#include <algorithm>
#include <regex>

namespace mcn_ls {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }
bool IsHexDigit(char c) { return IsDigit(c) || (c >= 'a' && c <= 'f'); }
bool IsBinaryDigit(char c) { return c == '0' || c == '1'; }
bool IsWordChar(char c) {
    return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c == '_';
}
bool IsBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';';
}
bool IsSymbolStart(char c) {
    return c == '+' || c == '-' || c == '*' || c == '&' || c == '|' ||
           c == '^' || c == '=' || c == '<' || c == '>' || c == '!';
}

// Length of the numeric literal at the start of s, or 0.
// Order matters: hex, then binary, then decimal.
size_t MatchNumber(std::string_view s, TokenClass& out_class) {
    if (s.size() > 2 && s[0] == '0' && s[1] == 'x' && IsHexDigit(s[2])) {
        size_t n = 3;
        while (n < s.size() && IsHexDigit(s[n])) ++n;
        out_class = TokenClass::NumberHex;
        return n;
    }
    if (s.size() > 2 && s[0] == '0' && s[1] == 'b' && IsBinaryDigit(s[2])) {
        size_t n = 3;
        while (n < s.size() && IsBinaryDigit(s[n])) ++n;
        out_class = TokenClass::NumberBinary;
        return n;
    }
    if (!s.empty() && IsDigit(s[0])) {
        size_t n = 1;
        while (n < s.size() && IsDigit(s[n])) ++n;
        out_class = TokenClass::Number;
        return n;
    }
    return 0;
}

// Length of the operator at the start of s per kSymbolsPattern, or 0.
size_t MatchSymbol(std::string_view s) {
    if (s.empty() || !IsSymbolStart(s[0])) return 0;
    const bool has_eq = s.size() > 1 && s[1] == '=';
    if (s[0] == '!') {
        return has_eq ? 2 : 0;
    }
    return has_eq ? 2 : 1;
}

const std::regex& IncreaseIndentRegex() {
    static const std::regex re(kIncreaseIndentPattern);
    return re;
}

const std::regex& DecreaseIndentRegex() {
    static const std::regex re(kDecreaseIndentPattern);
    return re;
}

const std::regex& OnEnterOpenerRegex() {
    static const std::regex re(kOnEnterOpenerPattern);
    return re;
}

const std::regex& OnEnterEndRegex() {
    static const std::regex re(kOnEnterEndPattern);
    return re;
}

bool FullMatch(std::string_view text, const std::regex& re) {
    return std::regex_match(text.begin(), text.end(), re);
}

nlohmann::json Pair(const char* open, const char* close) {
    return {{"open", open}, {"close", close}};
}

} // anonymous namespace

const std::vector<std::string>& Keywords() {
    static const std::vector<std::string> keywords = {
        "inline", "if", "elif", "elseif", "else", "forever",
        "while", "end", "pass", "use", "var", "debug",
    };
    return keywords;
}

const std::vector<std::string>& Operators() {
    static const std::vector<std::string> operators = {
        "+", "-", "*", "&", "|", "^",
        "+=", "-=", "*=", "&=", "|=", "^=",
        "=", "==", "!=", "<", ">", "<=", ">=",
    };
    return operators;
}

bool IsKeyword(std::string_view word) {
    const auto& keywords = Keywords();
    return std::find(keywords.begin(), keywords.end(), word) != keywords.end();
}

bool IsOperator(std::string_view text) {
    const auto& operators = Operators();
    return std::find(operators.begin(), operators.end(), text) != operators.end();
}

const char* TokenClassName(TokenClass token_class) {
    switch (token_class) {
        case TokenClass::Keyword:      return "keyword";
        case TokenClass::Identifier:   return "identifier";
        case TokenClass::Operator:     return "operator";
        case TokenClass::NumberHex:    return "number.hex";
        case TokenClass::NumberBinary: return "number.binary";
        case TokenClass::Number:       return "number";
        case TokenClass::Comment:      return "comment";
        case TokenClass::Parenthesis:  return "delimiter.parenthesis";
        case TokenClass::Separator:    return "punctuation.separator";
        case TokenClass::Invalid:      return "invalid";
    }
    return "invalid";
}

std::vector<HighlightToken> TokenizeForHighlight(std::string_view text) {
    std::vector<HighlightToken> tokens;
    uint32_t line = 0;
    uint32_t column = 0;
    size_t i = 0;

    auto emit = [&](TokenClass cls, size_t length) {
        tokens.push_back({cls, std::string(text.substr(i, length)), line, column});
        i += length;
        column += static_cast<uint32_t>(length);
    };

    while (i < text.size()) {
        const char c = text[i];
        const auto rest = text.substr(i);

        TokenClass number_class = TokenClass::Number;
        if (auto n = MatchNumber(rest, number_class); n > 0) {
            emit(number_class, n);
            continue;
        }

        if (IsBlank(c)) {
            if (c == '\n') {
                ++line;
                column = 0;
            } else {
                ++column;
            }
            ++i;
            continue;
        }

        if (c == '#') {
            auto eol = rest.find('\n');
            emit(TokenClass::Comment, eol == std::string_view::npos ? rest.size() : eol);
            continue;
        }

        if (c == '(' || c == ')') {
            emit(TokenClass::Parenthesis, 1);
            continue;
        }

        if (c == ',' || c == '.') {
            emit(TokenClass::Separator, 1);
            continue;
        }

        if (auto n = MatchSymbol(rest); n > 0) {
            emit(TokenClass::Operator, n);
            continue;
        }

        if (IsWordChar(c)) {
            size_t n = 1;
            while (n < rest.size() && IsWordChar(rest[n])) ++n;
            emit(IsKeyword(rest.substr(0, n)) ? TokenClass::Keyword
                                              : TokenClass::Identifier,
                 n);
            continue;
        }

        emit(TokenClass::Invalid, 1);
    }

    return tokens;
}

const char* IndentActionName(IndentAction action) {
    switch (action) {
        case IndentAction::None:          return "none";
        case IndentAction::Indent:        return "indent";
        case IndentAction::IndentOutdent: return "indentOutdent";
        case IndentAction::Outdent:       return "outdent";
    }
    return "none";
}

bool IncreasesIndent(std::string_view line) {
    return FullMatch(line, IncreaseIndentRegex());
}

bool DecreasesIndent(std::string_view line) {
    return FullMatch(line, DecreaseIndentRegex());
}

IndentAction OnEnterAction(std::string_view before_text) {
    if (FullMatch(before_text, OnEnterOpenerRegex())) {
        return IndentAction::IndentOutdent;
    }
    if (FullMatch(before_text, OnEnterEndRegex())) {
        return IndentAction::Outdent;
    }
    return IndentAction::None;
}

nlohmann::json GrammarToJson() {
    nlohmann::json monarch;
    monarch["brackets"] = nlohmann::json::array({
        {{"open", "("}, {"close", ")"}, {"token", "delimiter.parenthesis"}}
    });
    monarch["defaultToken"] = "invalid";
    monarch["ignoreCase"] = false;
    monarch["tokenPostfix"] = kTokenPostfix;
    monarch["keywords"] = Keywords();
    monarch["operators"] = Operators();
    monarch["symbols"] = kSymbolsPattern;
    monarch["tokenizer"] = {
        {"root", nlohmann::json::array({
            {{"include", "@numbers"}},
            {{"include", "@whitespace"}},
            nlohmann::json::array({"[()]", "@brackets"}),
            nlohmann::json::array({"[,.]", "punctuation.separator"}),
            nlohmann::json::array({"@symbols", "operator"}),
            nlohmann::json::array({
                R"([\w][\d\w]*)",
                {{"cases", {{"@keywords", "keyword"}, {"@default", "identifier"}}}}
            }),
        })},
        {"whitespace", nlohmann::json::array({
            nlohmann::json::array({R"([ \t\r\n;]+)", ""}),
            nlohmann::json::array({"#.*$", "comment"}),
        })},
        {"numbers", nlohmann::json::array({
            nlohmann::json::array({"0x[0-9a-f]+", "number.hex"}),
            nlohmann::json::array({"0b[01]+", "number.binary"}),
            nlohmann::json::array({R"(\d+)", "number"}),
        })},
    };

    nlohmann::json config;
    config["comments"] = {{"lineComment", "#"}};
    config["brackets"] = nlohmann::json::array({nlohmann::json::array({"(", ")"})});
    config["autoClosingPairs"] = nlohmann::json::array({Pair("(", ")")});
    config["surroundingPairs"] = nlohmann::json::array({
        Pair("(", ")"),
        Pair("forever", "end"),
        Pair("while", "end"),
        Pair("if", "end"),
        Pair("if", "else"),
        Pair("if", "elif"),
        Pair("if", "elseif"),
        Pair("elif", "end"),
        Pair("elseif", "end"),
        Pair("else", "end"),
    });
    config["indentationRules"] = {
        {"increaseIndentPattern", kIncreaseIndentPattern},
        {"decreaseIndentPattern", kDecreaseIndentPattern},
    };
    config["onEnterRules"] = nlohmann::json::array({
        {{"beforeText", kOnEnterOpenerPattern},
         {"action", {{"indentAction", IndentActionName(IndentAction::IndentOutdent)}}}},
        {{"beforeText", kOnEnterEndPattern},
         {"action", {{"indentAction", IndentActionName(IndentAction::Outdent)}}}},
    });

    return {
        {"languageId", kLanguageId},
        {"monarch", monarch},
        {"languageConfiguration", config},
    };
}

} // namespace mcn_ls
