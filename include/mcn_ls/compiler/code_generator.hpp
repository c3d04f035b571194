#pragma once

#include <mcn_ls/compiler/ast.hpp>
#include <mcn_ls/compiler/instruction.hpp>
#include <mcn_ls/core/result.hpp>

#include <array>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// CodeGenerator: lowers a parsed program to target instructions.
//
// Top-level statements are generated independently so that every failing
// statement contributes one error. Inside a block, generation stops at the
// first error. A generator instance is single-use.
// ---------------------------------------------------------------------------
class CodeGenerator {
public:
    Result<std::vector<Instruction>, std::vector<CompileError>> Generate(
        const std::vector<Node>& program);

private:
    using Status = Result<void, CompileError>;

    struct Scope {
        std::map<std::string, uint16_t> variables;  // name -> slot
        std::map<std::string, uint16_t> constants;  // inline name -> value
    };

    // -- Statements ---------------------------------------------------------
    Status EvalStatement(const Node& node);
    Status EvalBlock(const Block& block);
    Status EvalConditional(const Node& node);
    Status EvalEndless(const Node& node);
    Status EvalWhile(const Node& node);
    Status EvalUse(const Node& node);
    Status EvalInline(const Node& node);

    // -- Expressions (result ends up in A) ----------------------------------
    Status EvalExpression(const Node& node);
    Status EvalAssignment(const Node& node);
    Status EvalCompoundAssignment(const Node& node);
    Status EvalCall(const Node& node);
    Status EvalIoCall(const std::string& function, const Node& call);

    // Leaves left in A and right in B. Ok(true) means the operands were
    // swapped, which commutative operations and comparisons tolerate.
    Result<bool, CompileError> LoadOperands(const Node& left, const Node& right,
                                            bool may_swap);
    Status LoadA(const Node& operand);
    Status LoadB(const Node& operand);
    Status JumpIf(const Node& condition, bool when_true, size_t mark);
    Result<uint16_t, CompileError> EvalConstant(const Node& node) const;

    // -- Symbols ------------------------------------------------------------
    [[nodiscard]] const uint16_t* FindConstant(const std::string& name) const;
    [[nodiscard]] const uint16_t* FindVariable(const std::string& name) const;
    Result<uint16_t, CompileError> DeclareVariable(const std::string& name,
                                                   const TextRange& range);
    Result<uint16_t, CompileError> AllocateSlot(const TextRange& range);
    void ReleaseSlot(uint16_t slot);
    void PopScope();

    // -- Emission -----------------------------------------------------------
    void Emit(Opcode opcode, const TextRange& range);
    void Emit(Opcode opcode, uint16_t arg, const TextRange& range);
    void EmitNumber(Opcode low, Opcode high, uint16_t value, const TextRange& range);
    size_t NewMark();
    void PlaceMark(size_t mark);
    void EmitJump(Opcode opcode, size_t mark, const TextRange& range);

    std::vector<Scope> scopes_;
    std::array<bool, kVariableSlots> slots_{};
    std::set<std::string> modules_;
    std::vector<Instruction> code_;
    std::vector<size_t> marks_;  // mark id -> instruction index
};

// Convenience wrapper over a fresh CodeGenerator.
Result<std::vector<Instruction>, std::vector<CompileError>> Generate(
    const std::vector<Node>& program);

} // namespace mcn_ls
