#include <mcn_ls/compiler/lexer.hpp>

#include <map>

namespace mcn_ls {

namespace {

constexpr uint32_t kMaxWord = 0xFFFF;

const std::map<std::string_view, TokenType>& KeywordTable() {
    static const std::map<std::string_view, TokenType> table = {
        {"inline", TokenType::Inline},
        {"if", TokenType::If},
        {"elif", TokenType::Elif},
        {"elseif", TokenType::Elif},
        {"else", TokenType::Else},
        {"forever", TokenType::Forever},
        {"while", TokenType::While},
        {"end", TokenType::End},
        {"pass", TokenType::Pass},
        {"use", TokenType::Use},
        {"var", TokenType::Var},
        {"debug", TokenType::Debug},
    };
    return table;
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }
bool IsIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
bool IsIdentChar(char c) { return IsIdentStart(c) || IsDigit(c); }

int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return 99;
}

bool ParseBinaryOp(char c, BinaryOp& out) {
    switch (c) {
        case '+': out = BinaryOp::Add; return true;
        case '-': out = BinaryOp::Sub; return true;
        case '*': out = BinaryOp::Mul; return true;
        case '&': out = BinaryOp::And; return true;
        case '|': out = BinaryOp::Or;  return true;
        case '^': out = BinaryOp::Xor; return true;
        default: return false;
    }
}

class Lexer {
public:
    explicit Lexer(std::string_view source) : source_(source) {}

    Result<std::vector<Token>, std::vector<CompileError>> Run() {
        while (pos_ < source_.size()) {
            LexOne();
        }
        Token eof;
        eof.type = TokenType::Eof;
        eof.range = {Here(), Here()};
        tokens_.push_back(std::move(eof));

        if (!errors_.empty()) {
            return Result<std::vector<Token>, std::vector<CompileError>>::Err(
                std::move(errors_));
        }
        return Result<std::vector<Token>, std::vector<CompileError>>::Ok(
            std::move(tokens_));
    }

private:
    Position Here() const { return {line_, column_}; }

    char Peek(size_t ahead = 0) const {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }

    void Advance(size_t count = 1) {
        for (size_t i = 0; i < count && pos_ < source_.size(); ++i) {
            if (source_[pos_] == '\n') {
                ++line_;
                column_ = 0;
            } else {
                ++column_;
            }
            ++pos_;
        }
    }

    void Push(TokenType type, Position start, size_t begin) {
        Token token;
        token.type = type;
        token.text = std::string(source_.substr(begin, pos_ - begin));
        token.range = {start, Here()};
        tokens_.push_back(std::move(token));
    }

    void LexOne() {
        const char c = Peek();
        const Position start = Here();
        const size_t begin = pos_;

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';') {
            Advance();
            return;
        }
        if (c == '#') {
            while (pos_ < source_.size() && Peek() != '\n') Advance();
            return;
        }
        if (IsDigit(c)) {
            LexNumber(start, begin);
            return;
        }
        if (IsIdentStart(c)) {
            while (IsIdentChar(Peek())) Advance();
            auto word = source_.substr(begin, pos_ - begin);
            auto it = KeywordTable().find(word);
            Push(it != KeywordTable().end() ? it->second : TokenType::Identifier,
                 start, begin);
            return;
        }

        BinaryOp op = BinaryOp::Add;
        if (ParseBinaryOp(c, op)) {
            const bool compound = Peek(1) == '=';
            Advance(compound ? 2 : 1);
            Push(compound ? TokenType::CompoundAssign : TokenType::BinaryOperator,
                 start, begin);
            tokens_.back().binary_op = op;
            return;
        }

        switch (c) {
            case '=':
                if (Peek(1) == '=') {
                    Advance(2);
                    PushComparison(CompareOp::Equal, start, begin);
                } else {
                    Advance();
                    Push(TokenType::Equals, start, begin);
                }
                return;
            case '!':
                if (Peek(1) == '=') {
                    Advance(2);
                    PushComparison(CompareOp::NotEqual, start, begin);
                    return;
                }
                break;
            case '<':
            case '>': {
                const bool or_equal = Peek(1) == '=';
                Advance(or_equal ? 2 : 1);
                CompareOp cmp = c == '<'
                    ? (or_equal ? CompareOp::LessEqual : CompareOp::Less)
                    : (or_equal ? CompareOp::GreaterEqual : CompareOp::Greater);
                PushComparison(cmp, start, begin);
                return;
            }
            case '(': {
                const bool call = !tokens_.empty() &&
                                  tokens_.back().type == TokenType::Identifier &&
                                  tokens_.back().range.end == start;
                Advance();
                Push(call ? TokenType::OpenCallParen : TokenType::OpenParen, start, begin);
                return;
            }
            case ')':
                Advance();
                Push(TokenType::CloseParen, start, begin);
                return;
            case ',':
                Advance();
                Push(TokenType::Comma, start, begin);
                return;
            case '.':
                Advance();
                Push(TokenType::Dot, start, begin);
                return;
            default:
                break;
        }

        Advance();
        errors_.push_back({"Unexpected character '" + std::string(1, c) + "'",
                           {start, Here()}});
    }

    void PushComparison(CompareOp op, Position start, size_t begin) {
        Push(TokenType::Comparison, start, begin);
        tokens_.back().compare_op = op;
    }

    void LexNumber(Position start, size_t begin) {
        int base = 10;
        if (Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'b') &&
            DigitValue(Peek(2)) < (Peek(1) == 'x' ? 16 : 2)) {
            base = Peek(1) == 'x' ? 16 : 2;
            Advance(2);
        }

        uint32_t value = 0;
        bool overflow = false;
        while (DigitValue(Peek()) < base) {
            value = value * static_cast<uint32_t>(base) +
                    static_cast<uint32_t>(DigitValue(Peek()));
            if (value > kMaxWord) {
                overflow = true;
                value = kMaxWord;
            }
            Advance();
        }

        if (overflow) {
            errors_.push_back({"Number literal out of range (0..65535): " +
                                   std::string(source_.substr(begin, pos_ - begin)),
                               {start, Here()}});
            return;
        }
        Push(TokenType::Number, start, begin);
        tokens_.back().number = static_cast<uint16_t>(value);
    }

    std::string_view source_;
    size_t pos_ = 0;
    uint32_t line_ = 0;
    uint32_t column_ = 0;
    std::vector<Token> tokens_;
    std::vector<CompileError> errors_;
};

} // anonymous namespace

const char* TokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::Inline:         return "inline";
        case TokenType::If:             return "if";
        case TokenType::Elif:           return "elif";
        case TokenType::Else:           return "else";
        case TokenType::Forever:        return "forever";
        case TokenType::While:          return "while";
        case TokenType::End:            return "end";
        case TokenType::Pass:           return "pass";
        case TokenType::Use:            return "use";
        case TokenType::Var:            return "var";
        case TokenType::Debug:          return "debug";
        case TokenType::Identifier:     return "identifier";
        case TokenType::Number:         return "number";
        case TokenType::BinaryOperator: return "operator";
        case TokenType::CompoundAssign: return "compound assignment";
        case TokenType::Equals:         return "'='";
        case TokenType::Comparison:     return "comparison";
        case TokenType::OpenParen:      return "'('";
        case TokenType::OpenCallParen:  return "'('";
        case TokenType::CloseParen:     return "')'";
        case TokenType::Comma:          return "','";
        case TokenType::Dot:            return "'.'";
        case TokenType::Eof:            return "end of input";
    }
    return "token";
}

CompareOp Negate(CompareOp op) {
    switch (op) {
        case CompareOp::Equal:        return CompareOp::NotEqual;
        case CompareOp::NotEqual:     return CompareOp::Equal;
        case CompareOp::Less:         return CompareOp::GreaterEqual;
        case CompareOp::Greater:      return CompareOp::LessEqual;
        case CompareOp::LessEqual:    return CompareOp::Greater;
        case CompareOp::GreaterEqual: return CompareOp::Less;
    }
    return CompareOp::NotEqual;
}

bool IsCommutative(BinaryOp op) {
    return op != BinaryOp::Sub;
}

Result<std::vector<Token>, std::vector<CompileError>> Tokenize(std::string_view source) {
    return Lexer(source).Run();
}

} // namespace mcn_ls
