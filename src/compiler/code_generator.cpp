#include <mcn_ls/compiler/code_generator.hpp>

#include <string>

namespace mcn_ls {

namespace {

using Status = Result<void, CompileError>;

const char* const kIoModule = "io";

Status Fail(std::string message, const TextRange& range) {
    return Status::Err(CompileError{std::move(message), range});
}

bool IsSimple(const Node& node) {
    return node.kind == NodeKind::NumericLiteral || node.kind == NodeKind::Identifier;
}

bool IsKnownModule(const std::string& name) {
    return name == kIoModule;
}

// Comparison that holds for (b, a) exactly when op holds for (a, b).
CompareOp Mirror(CompareOp op) {
    switch (op) {
        case CompareOp::Less:         return CompareOp::Greater;
        case CompareOp::Greater:      return CompareOp::Less;
        case CompareOp::LessEqual:    return CompareOp::GreaterEqual;
        case CompareOp::GreaterEqual: return CompareOp::LessEqual;
        default:                      return op;
    }
}

uint16_t Fold(BinaryOp op, uint16_t left, uint16_t right) {
    switch (op) {
        case BinaryOp::Add: return static_cast<uint16_t>(left + right);
        case BinaryOp::Sub: return static_cast<uint16_t>(left - right);
        case BinaryOp::Mul: return static_cast<uint16_t>(left * right);
        case BinaryOp::And: return static_cast<uint16_t>(left & right);
        case BinaryOp::Or:  return static_cast<uint16_t>(left | right);
        case BinaryOp::Xor: return static_cast<uint16_t>(left ^ right);
    }
    return 0;
}

} // anonymous namespace

Result<std::vector<Instruction>, std::vector<CompileError>> CodeGenerator::Generate(
    const std::vector<Node>& program) {
    using GenerateResult = Result<std::vector<Instruction>, std::vector<CompileError>>;

    scopes_.assign(1, Scope{});
    std::vector<CompileError> errors;
    for (const auto& statement : program) {
        auto status = EvalStatement(statement);
        if (status.IsErr()) {
            errors.push_back(status.Error());
        }
    }
    if (!errors.empty()) {
        return GenerateResult::Err(std::move(errors));
    }

    if (code_.size() > kMaxInstructions) {
        const TextRange range = program.front().range.Cover(program.back().range);
        return GenerateResult::Err(std::vector<CompileError>{CompileError{
            "Program is too long: " + std::to_string(code_.size()) +
                " instructions (maximum " + std::to_string(kMaxInstructions) + ")",
            range}});
    }

    // Jump arguments hold mark ids until every mark is placed.
    for (auto& instruction : code_) {
        if (IsJump(instruction.opcode)) {
            instruction.arg = static_cast<uint16_t>(marks_[*instruction.arg]);
        }
    }
    return GenerateResult::Ok(std::move(code_));
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

Status CodeGenerator::EvalStatement(const Node& node) {
    switch (node.kind) {
        case NodeKind::Pass:
            return Status::Ok();
        case NodeKind::InlineDeclaration:
            return EvalInline(node);
        case NodeKind::Use:
            return EvalUse(node);
        case NodeKind::VarDeclaration: {
            auto slot = DeclareVariable(node.name, node.range);
            if (slot.IsErr()) {
                return Status::Err(slot.Error());
            }
            return Status::Ok();
        }
        case NodeKind::Conditional:
            return EvalConditional(node);
        case NodeKind::EndlessLoop:
            return EvalEndless(node);
        case NodeKind::WhileLoop:
            return EvalWhile(node);
        default:
            return EvalExpression(node);
    }
}

Status CodeGenerator::EvalBlock(const Block& block) {
    scopes_.emplace_back();
    Status status = Status::Ok();
    for (const auto& statement : block) {
        status = EvalStatement(statement);
        if (status.IsErr()) {
            break;
        }
    }
    PopScope();
    return status;
}

Status CodeGenerator::EvalConditional(const Node& node) {
    const size_t end = NewMark();
    const bool has_alternate = node.alternate.has_value();

    for (size_t i = 0; i < node.branches.size(); ++i) {
        const Branch& branch = node.branches[i];
        const size_t next = NewMark();

        auto status = JumpIf(*branch.condition, false, next);
        if (status.IsErr()) {
            return status;
        }
        status = EvalBlock(branch.body);
        if (status.IsErr()) {
            return status;
        }
        if (i + 1 < node.branches.size() || has_alternate) {
            EmitJump(Opcode::JMP, end, branch.condition->range);
        }
        PlaceMark(next);
    }

    if (has_alternate) {
        auto status = EvalBlock(*node.alternate);
        if (status.IsErr()) {
            return status;
        }
    }
    PlaceMark(end);
    return Status::Ok();
}

Status CodeGenerator::EvalEndless(const Node& node) {
    const size_t start = NewMark();
    PlaceMark(start);
    auto status = EvalBlock(node.body);
    if (status.IsErr()) {
        return status;
    }
    EmitJump(Opcode::JMP, start, node.range);
    return Status::Ok();
}

Status CodeGenerator::EvalWhile(const Node& node) {
    const Node& condition = *node.right;
    const size_t start = NewMark();
    const size_t end = NewMark();

    auto status = JumpIf(condition, false, end);
    if (status.IsErr()) {
        return status;
    }
    PlaceMark(start);
    status = EvalBlock(node.body);
    if (status.IsErr()) {
        return status;
    }
    status = JumpIf(condition, true, start);
    if (status.IsErr()) {
        return status;
    }
    PlaceMark(end);
    return Status::Ok();
}

Status CodeGenerator::EvalUse(const Node& node) {
    if (scopes_.size() != 1) {
        return Fail("'use' is only allowed at top level", node.range);
    }
    for (const auto& module : node.path) {
        if (!IsKnownModule(module)) {
            return Fail("Unknown module '" + module + "'", node.range);
        }
        modules_.insert(module);
    }
    return Status::Ok();
}

Status CodeGenerator::EvalInline(const Node& node) {
    auto value = EvalConstant(*node.right);
    if (value.IsErr()) {
        return Fail("Inline value must be a compile-time constant", value.Error().range);
    }
    scopes_.back().constants[node.name] = value.Value();
    return Status::Ok();
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

Status CodeGenerator::EvalExpression(const Node& node) {
    switch (node.kind) {
        case NodeKind::NumericLiteral:
        case NodeKind::Identifier:
            return LoadA(node);
        case NodeKind::Debug:
            Emit(Opcode::LAL, kDebugValue, node.range);
            return Status::Ok();
        case NodeKind::Binary: {
            auto loaded = LoadOperands(*node.left, *node.right, IsCommutative(node.binary_op));
            if (loaded.IsErr()) {
                return Status::Err(loaded.Error());
            }
            Emit(OpcodeFor(node.binary_op), node.range);
            return Status::Ok();
        }
        case NodeKind::Comparison:
            return Fail("Comparison is only allowed in a condition", node.range);
        case NodeKind::Assignment:
            return EvalAssignment(node);
        case NodeKind::CompoundAssignment:
            return EvalCompoundAssignment(node);
        case NodeKind::Member:
            return Fail("Member access is only allowed in a module call", node.range);
        case NodeKind::Call:
            return EvalCall(node);
        default:
            return Fail("Statement is not allowed inside an expression", node.range);
    }
}

Status CodeGenerator::EvalAssignment(const Node& node) {
    if (FindConstant(node.name) != nullptr) {
        return Fail("Cannot assign to inline constant '" + node.name + "'", node.range);
    }
    auto status = EvalExpression(*node.right);
    if (status.IsErr()) {
        return status;
    }
    auto slot = DeclareVariable(node.name, node.range);
    if (slot.IsErr()) {
        return Status::Err(slot.Error());
    }
    Emit(Opcode::SVA, slot.Value(), node.range);
    return Status::Ok();
}

Status CodeGenerator::EvalCompoundAssignment(const Node& node) {
    if (FindConstant(node.name) != nullptr) {
        return Fail("Cannot assign to inline constant '" + node.name + "'", node.range);
    }
    const uint16_t* found = FindVariable(node.name);
    if (found == nullptr) {
        return Fail("Unknown variable '" + node.name + "'", node.range);
    }
    const uint16_t slot = *found;
    const Node& value = *node.right;

    if (IsCommutative(node.binary_op)) {
        auto status = EvalExpression(value);
        if (status.IsErr()) {
            return status;
        }
        Emit(Opcode::LB, slot, node.range);
    } else if (IsSimple(value)) {
        Emit(Opcode::LA, slot, node.range);
        auto status = LoadB(value);
        if (status.IsErr()) {
            return status;
        }
    } else {
        auto status = EvalExpression(value);
        if (status.IsErr()) {
            return status;
        }
        auto temp = AllocateSlot(node.range);
        if (temp.IsErr()) {
            return Status::Err(temp.Error());
        }
        Emit(Opcode::SVA, temp.Value(), node.range);
        Emit(Opcode::LA, slot, node.range);
        Emit(Opcode::LB, temp.Value(), node.range);
        ReleaseSlot(temp.Value());
    }

    Emit(OpcodeFor(node.binary_op), node.range);
    Emit(Opcode::SVA, slot, node.range);
    return Status::Ok();
}

Status CodeGenerator::EvalCall(const Node& node) {
    const Node& callee = *node.left;
    if (callee.kind != NodeKind::Member || callee.left->kind != NodeKind::Identifier) {
        return Fail("Only module functions can be called", callee.range);
    }

    const std::string& module = callee.left->name;
    if (modules_.count(module) == 0) {
        if (IsKnownModule(module)) {
            return Fail("Module '" + module + "' is not loaded", callee.range);
        }
        return Fail("Unknown module '" + module + "'", callee.range);
    }
    return EvalIoCall(callee.name, node);
}

Status CodeGenerator::EvalIoCall(const std::string& function, const Node& call) {
    auto port_of = [this](const Node& arg) -> Result<uint16_t, CompileError> {
        auto port = EvalConstant(arg);
        if (port.IsErr()) {
            return Result<uint16_t, CompileError>::Err(
                CompileError{"Port must be a compile-time constant", arg.range});
        }
        if (port.Value() >= kPortCount) {
            return Result<uint16_t, CompileError>::Err(CompileError{
                "Port out of range (0.." + std::to_string(kPortCount - 1) +
                    "): " + std::to_string(port.Value()),
                arg.range});
        }
        return port;
    };

    if (function == "write") {
        if (call.args.size() != 2) {
            return Fail("io.write expects 2 arguments (port, value)", call.range);
        }
        auto port = port_of(call.args[0]);
        if (port.IsErr()) {
            return Status::Err(port.Error());
        }
        auto status = EvalExpression(call.args[1]);
        if (status.IsErr()) {
            return status;
        }
        Emit(Opcode::SVA, static_cast<uint16_t>(kPortBase + port.Value()), call.range);
        return Status::Ok();
    }

    if (function == "read") {
        if (call.args.size() != 1) {
            return Fail("io.read expects 1 argument (port)", call.range);
        }
        auto port = port_of(call.args[0]);
        if (port.IsErr()) {
            return Status::Err(port.Error());
        }
        Emit(Opcode::LA, static_cast<uint16_t>(kPortBase + port.Value()), call.range);
        return Status::Ok();
    }

    return Fail("Unknown function 'io." + function + "'", call.left->range);
}

Result<bool, CompileError> CodeGenerator::LoadOperands(const Node& left, const Node& right,
                                                       bool may_swap) {
    using LoadResult = Result<bool, CompileError>;

    if (IsSimple(right)) {
        auto status = LoadA(left);
        if (status.IsErr()) {
            return LoadResult::Err(status.Error());
        }
        status = LoadB(right);
        if (status.IsErr()) {
            return LoadResult::Err(status.Error());
        }
        return LoadResult::Ok(false);
    }

    auto status = EvalExpression(right);
    if (status.IsErr()) {
        return LoadResult::Err(status.Error());
    }

    if (may_swap && IsSimple(left)) {
        status = LoadB(left);
        if (status.IsErr()) {
            return LoadResult::Err(status.Error());
        }
        return LoadResult::Ok(true);
    }

    auto temp = AllocateSlot(left.range);
    if (temp.IsErr()) {
        return LoadResult::Err(temp.Error());
    }
    Emit(Opcode::SVA, temp.Value(), right.range);
    status = EvalExpression(left);
    if (status.IsErr()) {
        ReleaseSlot(temp.Value());
        return LoadResult::Err(status.Error());
    }
    Emit(Opcode::LB, temp.Value(), right.range);
    ReleaseSlot(temp.Value());
    return LoadResult::Ok(false);
}

Status CodeGenerator::LoadA(const Node& operand) {
    if (operand.kind == NodeKind::NumericLiteral) {
        EmitNumber(Opcode::LAL, Opcode::LAH, operand.number, operand.range);
        return Status::Ok();
    }
    if (operand.kind != NodeKind::Identifier) {
        return EvalExpression(operand);
    }
    if (const uint16_t* value = FindConstant(operand.name)) {
        EmitNumber(Opcode::LAL, Opcode::LAH, *value, operand.range);
        return Status::Ok();
    }
    if (const uint16_t* slot = FindVariable(operand.name)) {
        Emit(Opcode::LA, *slot, operand.range);
        return Status::Ok();
    }
    return Fail("Unknown variable '" + operand.name + "'", operand.range);
}

Status CodeGenerator::LoadB(const Node& operand) {
    if (operand.kind == NodeKind::NumericLiteral) {
        EmitNumber(Opcode::LBL, Opcode::LBH, operand.number, operand.range);
        return Status::Ok();
    }
    if (operand.kind != NodeKind::Identifier) {
        return Fail("Operand cannot be loaded into register B", operand.range);
    }
    if (const uint16_t* value = FindConstant(operand.name)) {
        EmitNumber(Opcode::LBL, Opcode::LBH, *value, operand.range);
        return Status::Ok();
    }
    if (const uint16_t* slot = FindVariable(operand.name)) {
        Emit(Opcode::LB, *slot, operand.range);
        return Status::Ok();
    }
    return Fail("Unknown variable '" + operand.name + "'", operand.range);
}

Status CodeGenerator::JumpIf(const Node& condition, bool when_true, size_t mark) {
    if (condition.kind != NodeKind::Comparison) {
        return Fail("Condition must be a comparison", condition.range);
    }
    CompareOp op = when_true ? condition.compare_op : Negate(condition.compare_op);

    auto swapped = LoadOperands(*condition.left, *condition.right, true);
    if (swapped.IsErr()) {
        return Status::Err(swapped.Error());
    }
    if (swapped.Value()) {
        op = Mirror(op);
    }
    EmitJump(JumpFor(op), mark, condition.range);
    return Status::Ok();
}

Result<uint16_t, CompileError> CodeGenerator::EvalConstant(const Node& node) const {
    using ConstResult = Result<uint16_t, CompileError>;

    switch (node.kind) {
        case NodeKind::NumericLiteral:
            return ConstResult::Ok(node.number);
        case NodeKind::Identifier:
            if (const uint16_t* value = FindConstant(node.name)) {
                return ConstResult::Ok(*value);
            }
            return ConstResult::Err(
                CompileError{"'" + node.name + "' is not a compile-time constant", node.range});
        case NodeKind::Binary: {
            auto left = EvalConstant(*node.left);
            if (left.IsErr()) {
                return left;
            }
            auto right = EvalConstant(*node.right);
            if (right.IsErr()) {
                return right;
            }
            return ConstResult::Ok(Fold(node.binary_op, left.Value(), right.Value()));
        }
        default:
            return ConstResult::Err(
                CompileError{"Expression is not a compile-time constant", node.range});
    }
}

// ---------------------------------------------------------------------------
// Symbols
// ---------------------------------------------------------------------------

const uint16_t* CodeGenerator::FindConstant(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->constants.find(name);
        if (found != it->constants.end()) {
            return &found->second;
        }
    }
    return nullptr;
}

const uint16_t* CodeGenerator::FindVariable(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->variables.find(name);
        if (found != it->variables.end()) {
            return &found->second;
        }
    }
    return nullptr;
}

Result<uint16_t, CompileError> CodeGenerator::DeclareVariable(const std::string& name,
                                                              const TextRange& range) {
    if (const uint16_t* existing = FindVariable(name)) {
        return Result<uint16_t, CompileError>::Ok(*existing);
    }
    auto slot = AllocateSlot(range);
    if (slot.IsOk()) {
        scopes_.back().variables[name] = slot.Value();
    }
    return slot;
}

Result<uint16_t, CompileError> CodeGenerator::AllocateSlot(const TextRange& range) {
    for (uint16_t slot = 0; slot < kVariableSlots; ++slot) {
        if (!slots_[slot]) {
            slots_[slot] = true;
            return Result<uint16_t, CompileError>::Ok(slot);
        }
    }
    return Result<uint16_t, CompileError>::Err(CompileError{
        "Too many variables (maximum " + std::to_string(kVariableSlots) + ")", range});
}

void CodeGenerator::ReleaseSlot(uint16_t slot) {
    slots_[slot] = false;
}

void CodeGenerator::PopScope() {
    for (const auto& entry : scopes_.back().variables) {
        ReleaseSlot(entry.second);
    }
    scopes_.pop_back();
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

void CodeGenerator::Emit(Opcode opcode, const TextRange& range) {
    code_.push_back(Instruction{opcode, std::nullopt, range});
}

void CodeGenerator::Emit(Opcode opcode, uint16_t arg, const TextRange& range) {
    code_.push_back(Instruction{opcode, arg, range});
}

void CodeGenerator::EmitNumber(Opcode low, Opcode high, uint16_t value,
                               const TextRange& range) {
    Emit(low, static_cast<uint16_t>(value & 0xFF), range);
    if ((value >> 8) != 0) {
        Emit(high, static_cast<uint16_t>(value >> 8), range);
    }
}

size_t CodeGenerator::NewMark() {
    marks_.push_back(0);
    return marks_.size() - 1;
}

void CodeGenerator::PlaceMark(size_t mark) {
    marks_[mark] = code_.size();
}

void CodeGenerator::EmitJump(Opcode opcode, size_t mark, const TextRange& range) {
    Emit(opcode, static_cast<uint16_t>(mark), range);
}

Result<std::vector<Instruction>, std::vector<CompileError>> Generate(
    const std::vector<Node>& program) {
    return CodeGenerator().Generate(program);
}

} // namespace mcn_ls
