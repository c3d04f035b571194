#pragma once

#include <mcn_ls/compiler/token.hpp>
#include <mcn_ls/core/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcn_ls {

enum class NodeKind {
    // Expressions
    NumericLiteral,
    Identifier,
    Debug,
    Binary,
    Comparison,
    Assignment,
    CompoundAssignment,
    Member,
    Call,
    // Statements
    Pass,
    VarDeclaration,
    InlineDeclaration,
    Use,
    Conditional,
    EndlessLoop,
    WhileLoop,
};

struct Node;
using NodePtr = std::unique_ptr<Node>;
using Block = std::vector<Node>;

// One `if`/`elif` arm.
struct Branch {
    NodePtr condition;
    Block body;
};

// ---------------------------------------------------------------------------
// Node: a single syntax tree node. Which fields are meaningful depends on
// kind:
//   NumericLiteral       number
//   Identifier           name
//   Binary, Comparison   left, right, binary_op / compare_op
//   Assignment           name, right (value)
//   CompoundAssignment   name, right (value), binary_op
//   Member               left (object), name (property)
//   Call                 left (callee), args
//   VarDeclaration       name
//   InlineDeclaration    name, right (value)
//   Use                  path
//   Conditional          branches, alternate
//   EndlessLoop          body
//   WhileLoop            right (condition), body
//
// height counts the expression nodes on the longest path down from this one,
// itself included. The parser keeps it bounded.
// ---------------------------------------------------------------------------
struct Node {
    NodeKind kind = NodeKind::Pass;
    TextRange range;
    uint16_t number = 0;
    std::string name;
    BinaryOp binary_op = BinaryOp::Add;
    CompareOp compare_op = CompareOp::Equal;
    NodePtr left;
    NodePtr right;
    Block body;
    std::vector<Branch> branches;
    std::optional<Block> alternate;
    std::vector<std::string> path;
    Block args;
    uint32_t height = 1;
};

} // namespace mcn_ls
