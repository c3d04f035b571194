#include <mcn_ls/compiler/instruction.hpp>

namespace mcn_ls {

const char* OpcodeName(Opcode opcode) {
    switch (opcode) {
        case Opcode::LAL: return "LAL";
        case Opcode::LAH: return "LAH";
        case Opcode::LBL: return "LBL";
        case Opcode::LBH: return "LBH";
        case Opcode::LA:  return "LA";
        case Opcode::LB:  return "LB";
        case Opcode::SVA: return "SVA";
        case Opcode::ADD: return "ADD";
        case Opcode::SUB: return "SUB";
        case Opcode::MUL: return "MUL";
        case Opcode::AND: return "AND";
        case Opcode::OR:  return "OR";
        case Opcode::XOR: return "XOR";
        case Opcode::JMP: return "JMP";
        case Opcode::JEQ: return "JEQ";
        case Opcode::JNE: return "JNE";
        case Opcode::JLT: return "JLT";
        case Opcode::JGT: return "JGT";
        case Opcode::JLE: return "JLE";
        case Opcode::JGE: return "JGE";
    }
    return "???";
}

bool IsJump(Opcode opcode) {
    switch (opcode) {
        case Opcode::JMP:
        case Opcode::JEQ:
        case Opcode::JNE:
        case Opcode::JLT:
        case Opcode::JGT:
        case Opcode::JLE:
        case Opcode::JGE:
            return true;
        default:
            return false;
    }
}

Opcode JumpFor(CompareOp op) {
    switch (op) {
        case CompareOp::Equal:        return Opcode::JEQ;
        case CompareOp::NotEqual:     return Opcode::JNE;
        case CompareOp::Less:         return Opcode::JLT;
        case CompareOp::Greater:      return Opcode::JGT;
        case CompareOp::LessEqual:    return Opcode::JLE;
        case CompareOp::GreaterEqual: return Opcode::JGE;
    }
    return Opcode::JMP;
}

Opcode OpcodeFor(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return Opcode::ADD;
        case BinaryOp::Sub: return Opcode::SUB;
        case BinaryOp::Mul: return Opcode::MUL;
        case BinaryOp::And: return Opcode::AND;
        case BinaryOp::Or:  return Opcode::OR;
        case BinaryOp::Xor: return Opcode::XOR;
    }
    return Opcode::ADD;
}

std::string Instruction::ToAssembly() const {
    std::string line = OpcodeName(opcode);
    if (arg.has_value()) {
        line += ' ';
        line += std::to_string(*arg);
    }
    return line;
}

std::string FormatAssembly(const std::vector<Instruction>& program) {
    std::string out;
    for (const auto& instruction : program) {
        out += instruction.ToAssembly();
        out += '\n';
    }
    return out;
}

} // namespace mcn_ls
