#include <mcn_ls/compiler/parser.hpp>

#include <algorithm>
#include <string>

namespace mcn_ls {

namespace {

Node MakeNode(NodeKind kind, const TextRange& range) {
    Node node;
    node.kind = kind;
    node.range = range;
    return node;
}

NodePtr Box(Node node) {
    return std::make_unique<Node>(std::move(node));
}

Node MakeOperation(NodeKind kind, Node left, Node right) {
    Node node = MakeNode(kind, left.range.Cover(right.range));
    node.left = Box(std::move(left));
    node.right = Box(std::move(right));
    node.height = 1 + std::max(node.left->height, node.right->height);
    return node;
}

// Holds one level of parser nesting for its lifetime.
class NestingGuard {
public:
    explicit NestingGuard(size_t& depth) : depth_(depth) { ++depth_; }
    ~NestingGuard() { --depth_; }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

    bool Exceeded() const { return depth_ > kMaxNestingDepth; }

private:
    size_t& depth_;
};

CompileError MakeError(std::string message, const TextRange& range) {
    return CompileError{std::move(message), range};
}

std::string Describe(const Token& token) {
    if (token.type == TokenType::Eof || token.text.empty()) {
        return TokenTypeName(token.type);
    }
    return "'" + token.text + "'";
}

} // anonymous namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::Eof) {
        Token eof;
        eof.type = TokenType::Eof;
        if (!tokens_.empty()) {
            eof.range = {tokens_.back().range.end, tokens_.back().range.end};
        }
        tokens_.push_back(std::move(eof));
    }
}

const Token& Parser::At() const {
    return tokens_[pos_];
}

CompileError Parser::NestingError(const TextRange& range) {
    nesting_exceeded_ = true;
    return MakeError("Nesting too deep (limit is " + std::to_string(kMaxNestingDepth) +
                         " levels)",
                     range);
}

const Token& Parser::Eat() {
    const Token& token = tokens_[pos_];
    // Eof is sticky: eating it again keeps returning it.
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

Result<std::vector<Node>, std::vector<CompileError>> Parser::ParseProgram() {
    std::vector<Node> program;
    std::vector<CompileError> errors;

    while (!AtType(TokenType::Eof)) {
        const size_t before = pos_;
        auto statement = ParseStatement();
        if (statement.IsOk()) {
            program.push_back(std::move(statement).Value());
        } else {
            errors.push_back(std::move(statement).Error());
            if (nesting_exceeded_) {
                break;
            }
            if (pos_ == before) {
                Eat();
            }
        }
    }

    if (!errors.empty()) {
        return Result<std::vector<Node>, std::vector<CompileError>>::Err(std::move(errors));
    }
    return Result<std::vector<Node>, std::vector<CompileError>>::Ok(std::move(program));
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

Parser::ParseResult Parser::ParseStatement() {
    switch (At().type) {
        case TokenType::Inline:  return ParseInlineDeclaration();
        case TokenType::If:      return ParseConditional();
        case TokenType::Use:     return ParseUse();
        case TokenType::Var:     return ParseVarDeclaration();
        case TokenType::Forever: return ParseEndless();
        case TokenType::While:   return ParseWhile();
        case TokenType::Pass:    return ParseResult::Ok(MakeNode(NodeKind::Pass, Eat().range));
        default:                 return ParseExpression();
    }
}

Parser::ParseResult Parser::ParseConditional() {
    const TextRange start = Eat().range;
    Node node = MakeNode(NodeKind::Conditional, start);

    auto first = ParseBranch();
    if (first.IsErr()) {
        return ParseResult::Err(std::move(first).Error());
    }
    node.branches.push_back(std::move(first).Value());

    while (AtType(TokenType::Elif)) {
        Eat();
        auto branch = ParseBranch();
        if (branch.IsErr()) {
            return ParseResult::Err(std::move(branch).Error());
        }
        node.branches.push_back(std::move(branch).Value());
    }

    if (AtType(TokenType::Else)) {
        const TextRange else_range = Eat().range;
        auto body = ParseBody({TokenType::End}, else_range);
        if (body.IsErr()) {
            return ParseResult::Err(std::move(body).Error());
        }
        node.alternate = std::move(body).Value();
    }

    auto end = ExpectEnd(start);
    if (end.IsErr()) {
        return ParseResult::Err(std::move(end).Error());
    }
    node.range = start.Cover(end.Value());
    return ParseResult::Ok(std::move(node));
}

Result<Branch, CompileError> Parser::ParseBranch() {
    auto condition = ParseExpression();
    if (condition.IsErr()) {
        return Result<Branch, CompileError>::Err(std::move(condition).Error());
    }
    const TextRange condition_range = condition.Value().range;

    auto body = ParseBody({TokenType::Elif, TokenType::Else, TokenType::End},
                          condition_range);
    if (body.IsErr()) {
        return Result<Branch, CompileError>::Err(std::move(body).Error());
    }

    Branch branch;
    branch.condition = Box(std::move(condition).Value());
    branch.body = std::move(body).Value();
    return Result<Branch, CompileError>::Ok(std::move(branch));
}

Parser::ParseResult Parser::ParseEndless() {
    const TextRange start = Eat().range;
    auto body = ParseBody({TokenType::End}, start);
    if (body.IsErr()) {
        return ParseResult::Err(std::move(body).Error());
    }
    auto end = ExpectEnd(start);
    if (end.IsErr()) {
        return ParseResult::Err(std::move(end).Error());
    }

    Node node = MakeNode(NodeKind::EndlessLoop, start.Cover(end.Value()));
    node.body = std::move(body).Value();
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseWhile() {
    const TextRange start = Eat().range;
    auto condition = ParseExpression();
    if (condition.IsErr()) {
        return condition;
    }
    auto body = ParseBody({TokenType::End}, start);
    if (body.IsErr()) {
        return ParseResult::Err(std::move(body).Error());
    }
    auto end = ExpectEnd(start);
    if (end.IsErr()) {
        return ParseResult::Err(std::move(end).Error());
    }

    Node node = MakeNode(NodeKind::WhileLoop, start.Cover(end.Value()));
    node.right = Box(std::move(condition).Value());
    node.body = std::move(body).Value();
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseUse() {
    const TextRange start = Eat().range;
    Node node = MakeNode(NodeKind::Use, start);

    const Token& first = Eat();
    if (first.type != TokenType::Identifier) {
        return ParseResult::Err(MakeError("Expected a module name after 'use'", first.range));
    }
    node.path.push_back(first.text);
    node.range = start.Cover(first.range);

    while (AtType(TokenType::Dot)) {
        Eat();
        const Token& part = Eat();
        if (part.type != TokenType::Identifier) {
            return ParseResult::Err(MakeError("Expected a module name after '.'", part.range));
        }
        node.path.push_back(part.text);
        node.range = start.Cover(part.range);
    }
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseVarDeclaration() {
    const TextRange start = Eat().range;
    const Token& name = Eat();
    if (name.type != TokenType::Identifier) {
        return ParseResult::Err(
            MakeError("Expected a variable name after 'var'", name.range));
    }
    Node node = MakeNode(NodeKind::VarDeclaration, start.Cover(name.range));
    node.name = name.text;
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseInlineDeclaration() {
    const TextRange start = Eat().range;
    const Token& name = Eat();
    if (name.type != TokenType::Identifier) {
        return ParseResult::Err(MakeError("Expected a name after 'inline'", name.range));
    }
    if (!AtType(TokenType::Equals)) {
        return ParseResult::Err(MakeError("Expected '=' after inline name", At().range));
    }
    Eat();

    auto value = ParseExpression();
    if (value.IsErr()) {
        return value;
    }
    Node node = MakeNode(NodeKind::InlineDeclaration, start.Cover(value.Value().range));
    node.name = name.text;
    node.right = Box(std::move(value).Value());
    return ParseResult::Ok(std::move(node));
}

Result<Block, CompileError> Parser::ParseBody(std::initializer_list<TokenType> terminators,
                                              const TextRange& owner) {
    auto at_terminator = [&]() {
        const auto type = At().type;
        return type == TokenType::Eof ||
               std::find(terminators.begin(), terminators.end(), type) != terminators.end();
    };

    NestingGuard guard(depth_);
    if (guard.Exceeded()) {
        return Result<Block, CompileError>::Err(NestingError(At().range));
    }

    Block body;
    while (!at_terminator()) {
        auto statement = ParseStatement();
        if (statement.IsErr()) {
            return Result<Block, CompileError>::Err(std::move(statement).Error());
        }
        body.push_back(std::move(statement).Value());
    }

    if (body.empty()) {
        return Result<Block, CompileError>::Err(
            MakeError("Empty block", owner.Cover(At().range)));
    }
    return Result<Block, CompileError>::Ok(std::move(body));
}

Result<TextRange, CompileError> Parser::ExpectEnd(const TextRange& owner) {
    if (!AtType(TokenType::End)) {
        return Result<TextRange, CompileError>::Err(
            MakeError("Missing 'end' for block", owner));
    }
    return Result<TextRange, CompileError>::Ok(Eat().range);
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

Parser::ParseResult Parser::ParseExpression() {
    NestingGuard guard(depth_);
    if (guard.Exceeded()) {
        return ParseResult::Err(NestingError(At().range));
    }
    return ParseAssignment();
}

Parser::ParseResult Parser::ParseAssignment() {
    auto left = ParseCompoundAssignment();
    if (left.IsErr() || !AtType(TokenType::Equals)) {
        return left;
    }
    if (left.Value().kind != NodeKind::Identifier) {
        return ParseResult::Err(MakeError("Invalid assignment target", At().range));
    }
    Eat();

    NestingGuard guard(depth_);
    if (guard.Exceeded()) {
        return ParseResult::Err(NestingError(At().range));
    }
    auto value = ParseAssignment();
    if (value.IsErr()) {
        return value;
    }
    Node target = std::move(left).Value();
    Node node = MakeNode(NodeKind::Assignment, target.range.Cover(value.Value().range));
    node.name = std::move(target.name);
    node.right = Box(std::move(value).Value());
    node.height = 1 + node.right->height;
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseCompoundAssignment() {
    auto left = ParseComparison();
    if (left.IsErr() || !AtType(TokenType::CompoundAssign)) {
        return left;
    }
    if (left.Value().kind != NodeKind::Identifier) {
        return ParseResult::Err(MakeError("Invalid assignment target", left.Value().range));
    }
    const BinaryOp op = Eat().binary_op;

    NestingGuard guard(depth_);
    if (guard.Exceeded()) {
        return ParseResult::Err(NestingError(At().range));
    }
    auto value = ParseCompoundAssignment();
    if (value.IsErr()) {
        return value;
    }
    Node target = std::move(left).Value();
    Node node = MakeNode(NodeKind::CompoundAssignment,
                         target.range.Cover(value.Value().range));
    node.name = std::move(target.name);
    node.binary_op = op;
    node.right = Box(std::move(value).Value());
    node.height = 1 + node.right->height;
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseComparison() {
    auto left = ParseAdditive();
    if (left.IsErr()) {
        return left;
    }
    Node result = std::move(left).Value();

    while (AtType(TokenType::Comparison)) {
        const CompareOp op = Eat().compare_op;
        auto right = ParseAdditive();
        if (right.IsErr()) {
            return right;
        }
        result = MakeOperation(NodeKind::Comparison, std::move(result),
                               std::move(right).Value());
        result.compare_op = op;
        if (result.height > kMaxNestingDepth) {
            return ParseResult::Err(NestingError(result.range));
        }
    }
    return ParseResult::Ok(std::move(result));
}

Parser::ParseResult Parser::ParseAdditive() {
    auto left = ParseMultiplicative();
    if (left.IsErr()) {
        return left;
    }
    Node result = std::move(left).Value();

    while (AtType(TokenType::BinaryOperator) && At().binary_op != BinaryOp::Mul) {
        const BinaryOp op = Eat().binary_op;
        auto right = ParseMultiplicative();
        if (right.IsErr()) {
            return right;
        }
        result = MakeOperation(NodeKind::Binary, std::move(result), std::move(right).Value());
        result.binary_op = op;
        if (result.height > kMaxNestingDepth) {
            return ParseResult::Err(NestingError(result.range));
        }
    }
    return ParseResult::Ok(std::move(result));
}

Parser::ParseResult Parser::ParseMultiplicative() {
    auto left = ParseCallMember();
    if (left.IsErr()) {
        return left;
    }
    Node result = std::move(left).Value();

    while (AtType(TokenType::BinaryOperator) && At().binary_op == BinaryOp::Mul) {
        Eat();
        auto right = ParseCallMember();
        if (right.IsErr()) {
            return right;
        }
        result = MakeOperation(NodeKind::Binary, std::move(result), std::move(right).Value());
        result.binary_op = BinaryOp::Mul;
        if (result.height > kMaxNestingDepth) {
            return ParseResult::Err(NestingError(result.range));
        }
    }
    return ParseResult::Ok(std::move(result));
}

Parser::ParseResult Parser::ParseCallMember() {
    auto callee = ParseMember();
    if (callee.IsErr() || !AtType(TokenType::OpenCallParen)) {
        return callee;
    }
    Eat();

    Block args;
    if (!AtType(TokenType::CloseParen)) {
        while (true) {
            auto arg = ParseExpression();
            if (arg.IsErr()) {
                return arg;
            }
            args.push_back(std::move(arg).Value());
            if (!AtType(TokenType::Comma)) {
                break;
            }
            Eat();
        }
    }

    if (!AtType(TokenType::CloseParen)) {
        return ParseResult::Err(
            MakeError("Expected ')' to close the argument list", At().range));
    }
    const TextRange close = Eat().range;
    if (AtType(TokenType::OpenCallParen)) {
        return ParseResult::Err(MakeError("Chained calls are not supported", At().range));
    }

    Node function = std::move(callee).Value();
    Node node = MakeNode(NodeKind::Call, function.range.Cover(close));
    node.left = Box(std::move(function));
    node.args = std::move(args);
    node.height = 1 + node.left->height;
    for (const Node& arg : node.args) {
        node.height = std::max(node.height, 1 + arg.height);
    }
    return ParseResult::Ok(std::move(node));
}

Parser::ParseResult Parser::ParseMember() {
    auto object = ParsePrimary();
    if (object.IsErr()) {
        return object;
    }
    Node result = std::move(object).Value();

    while (AtType(TokenType::Dot)) {
        const TextRange dot = Eat().range;
        const Token& property = At();
        if (property.type != TokenType::Identifier) {
            return ParseResult::Err(MakeError("Expected a name after '.'", dot));
        }
        Eat();
        Node member = MakeNode(NodeKind::Member, result.range.Cover(property.range));
        member.left = Box(std::move(result));
        member.name = property.text;
        member.height = 1 + member.left->height;
        result = std::move(member);
        if (result.height > kMaxNestingDepth) {
            return ParseResult::Err(NestingError(result.range));
        }
    }
    return ParseResult::Ok(std::move(result));
}

Parser::ParseResult Parser::ParsePrimary() {
    const Token& token = Eat();

    switch (token.type) {
        case TokenType::Identifier: {
            Node node = MakeNode(NodeKind::Identifier, token.range);
            node.name = token.text;
            return ParseResult::Ok(std::move(node));
        }
        case TokenType::Number: {
            Node node = MakeNode(NodeKind::NumericLiteral, token.range);
            node.number = token.number;
            return ParseResult::Ok(std::move(node));
        }
        case TokenType::Debug:
            return ParseResult::Ok(MakeNode(NodeKind::Debug, token.range));
        case TokenType::OpenParen: {
            auto inner = ParseExpression();
            if (inner.IsErr()) {
                return inner;
            }
            if (!AtType(TokenType::CloseParen)) {
                return ParseResult::Err(MakeError("Expected ')'", At().range));
            }
            Eat();
            return inner;
        }
        case TokenType::Eof:
            return ParseResult::Err(MakeError("Unexpected end of input", token.range));
        default:
            return ParseResult::Err(
                MakeError("Unexpected " + Describe(token), token.range));
    }
}

Result<std::vector<Node>, std::vector<CompileError>> Parse(std::vector<Token> tokens) {
    return Parser(std::move(tokens)).ParseProgram();
}

} // namespace mcn_ls
