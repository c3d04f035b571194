#pragma once

#include <mcn_ls/compiler/token.hpp>
#include <mcn_ls/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcn_ls {

// Target machine limits.
constexpr uint16_t kVariableSlots = 32;
constexpr uint16_t kPortCount = 16;
constexpr uint16_t kPortBase = kVariableSlots;  // ports live right after the slots
constexpr size_t kMaxInstructions = 256;
constexpr uint16_t kDebugValue = 17;

// ---------------------------------------------------------------------------
// Opcode: instruction set of the two-register (A/B) target machine.
// Conditional jumps compare A against B.
// ---------------------------------------------------------------------------
enum class Opcode {
    LAL,  // A.low  = arg
    LAH,  // A.high = arg
    LBL,  // B.low  = arg
    LBH,  // B.high = arg
    LA,   // A = mem[arg]
    LB,   // B = mem[arg]
    SVA,  // mem[arg] = A
    ADD,
    SUB,
    MUL,
    AND,
    OR,
    XOR,
    JMP,
    JEQ,
    JNE,
    JLT,
    JGT,
    JLE,
    JGE,
};

[[nodiscard]] const char* OpcodeName(Opcode opcode);
[[nodiscard]] bool IsJump(Opcode opcode);
[[nodiscard]] Opcode JumpFor(CompareOp op);
[[nodiscard]] Opcode OpcodeFor(BinaryOp op);

struct Instruction {
    Opcode opcode = Opcode::JMP;
    std::optional<uint16_t> arg;
    TextRange range;  // source that produced this instruction

    // "MNEMONIC" or "MNEMONIC ARG".
    [[nodiscard]] std::string ToAssembly() const;

    bool operator==(const Instruction& other) const {
        return opcode == other.opcode && arg == other.arg;
    }
    bool operator!=(const Instruction& other) const { return !(*this == other); }
};

// One instruction per line, each line newline-terminated.
std::string FormatAssembly(const std::vector<Instruction>& program);

} // namespace mcn_ls
