#include <cassert>
#include <ostream>
#include <stdexcept>
#include <type_traits>

#include "instruction.h"

using namespace WASMDecoder;

static void printIndentation(std::ostream& out, u32 indent)
{
	for (u32 i = 0; i != indent; i++) {
		out << "  ";
	}
}

std::optional<InstructionType> InstructionType::fromName(std::string_view name)
{
	for (u32 i = 0; i != NumberOfItems; i++) {
		auto type = InstructionType::fromInt(i);
		if (name == type.name()) {
			return type;
		}
	}

	return {};
}

bool InstructionType::isBlock() const
{
	return value == Block || value == Loop || value == If;
}

bool InstructionType::isBlockTerminator() const
{
	return value == Else || value == End;
}

bool InstructionType::isMemory() const
{
	return value >= I32Load && value <= I64Store32;
}

const char* InstructionType::name() const
{
	switch (value) {
	case Unreachable: return "unreachable";
	case NoOperation: return "nop";
	case Block: return "block";
	case Loop: return "loop";
	case If: return "if";
	case Else: return "else";
	case End: return "end";
	case Branch: return "br";
	case BranchIf: return "br_if";
	case BranchTable: return "br_table";
	case Return: return "return";
	case Call: return "call";
	case CallIndirect: return "call_indirect";
	case Drop: return "drop";
	case Select: return "select";
	case SelectFrom: return "select_t";
	case LocalGet: return "local.get";
	case LocalSet: return "local.set";
	case LocalTee: return "local.tee";
	case GlobalGet: return "global.get";
	case GlobalSet: return "global.set";
	case ReferenceNull: return "ref.null";
	case ReferenceIsNull: return "ref.is_null";
	case ReferenceFunction: return "ref.func";
	case TableGet: return "table.get";
	case TableSet: return "table.set";
	case TableInit: return "table.init";
	case ElementDrop: return "elem.drop";
	case TableCopy: return "table.copy";
	case TableGrow: return "table.grow";
	case TableSize: return "table.size";
	case TableFill: return "table.fill";
	case I32Load: return "i32.load";
	case I64Load: return "i64.load";
	case F32Load: return "f32.load";
	case F64Load: return "f64.load";
	case I32Load8s: return "i32.load8_s";
	case I32Load8u: return "i32.load8_u";
	case I32Load16s: return "i32.load16_s";
	case I32Load16u: return "i32.load16_u";
	case I64Load8s: return "i64.load8_s";
	case I64Load8u: return "i64.load8_u";
	case I64Load16s: return "i64.load16_s";
	case I64Load16u: return "i64.load16_u";
	case I64Load32s: return "i64.load32_s";
	case I64Load32u: return "i64.load32_u";
	case I32Store: return "i32.store";
	case I64Store: return "i64.store";
	case F32Store: return "f32.store";
	case F64Store: return "f64.store";
	case I32Store8: return "i32.store8";
	case I32Store16: return "i32.store16";
	case I64Store8: return "i64.store8";
	case I64Store16: return "i64.store16";
	case I64Store32: return "i64.store32";
	case MemorySize: return "memory.size";
	case MemoryGrow: return "memory.grow";
	case MemoryInit: return "memory.init";
	case DataDrop: return "data.drop";
	case MemoryCopy: return "memory.copy";
	case MemoryFill: return "memory.fill";
	case I32Const: return "i32.const";
	case I64Const: return "i64.const";
	case F32Const: return "f32.const";
	case F64Const: return "f64.const";
	case I32EqualZero: return "i32.eqz";
	case I32Equal: return "i32.eq";
	case I32NotEqual: return "i32.ne";
	case I32LesserS: return "i32.lt_s";
	case I32LesserU: return "i32.lt_u";
	case I32GreaterS: return "i32.gt_s";
	case I32GreaterU: return "i32.gt_u";
	case I32LesserEqualS: return "i32.le_s";
	case I32LesserEqualU: return "i32.le_u";
	case I32GreaterEqualS: return "i32.ge_s";
	case I32GreaterEqualU: return "i32.ge_u";
	case I64EqualZero: return "i64.eqz";
	case I64Equal: return "i64.eq";
	case I64NotEqual: return "i64.ne";
	case I64LesserS: return "i64.lt_s";
	case I64LesserU: return "i64.lt_u";
	case I64GreaterS: return "i64.gt_s";
	case I64GreaterU: return "i64.gt_u";
	case I64LesserEqualS: return "i64.le_s";
	case I64LesserEqualU: return "i64.le_u";
	case I64GreaterEqualS: return "i64.ge_s";
	case I64GreaterEqualU: return "i64.ge_u";
	case F32Equal: return "f32.eq";
	case F32NotEqual: return "f32.ne";
	case F32Lesser: return "f32.lt";
	case F32Greater: return "f32.gt";
	case F32LesserEqual: return "f32.le";
	case F32GreaterEqual: return "f32.ge";
	case F64Equal: return "f64.eq";
	case F64NotEqual: return "f64.ne";
	case F64Lesser: return "f64.lt";
	case F64Greater: return "f64.gt";
	case F64LesserEqual: return "f64.le";
	case F64GreaterEqual: return "f64.ge";
	case I32CountLeadingZeros: return "i32.clz";
	case I32CountTrailingZeros: return "i32.ctz";
	case I32CountOnes: return "i32.popcnt";
	case I32Add: return "i32.add";
	case I32Subtract: return "i32.sub";
	case I32Multiply: return "i32.mul";
	case I32DivideS: return "i32.div_s";
	case I32DivideU: return "i32.div_u";
	case I32RemainderS: return "i32.rem_s";
	case I32RemainderU: return "i32.rem_u";
	case I32And: return "i32.and";
	case I32Or: return "i32.or";
	case I32Xor: return "i32.xor";
	case I32ShiftLeft: return "i32.shl";
	case I32ShiftRightS: return "i32.shr_s";
	case I32ShiftRightU: return "i32.shr_u";
	case I32RotateLeft: return "i32.rotl";
	case I32RotateRight: return "i32.rotr";
	case I64CountLeadingZeros: return "i64.clz";
	case I64CountTrailingZeros: return "i64.ctz";
	case I64CountOnes: return "i64.popcnt";
	case I64Add: return "i64.add";
	case I64Subtract: return "i64.sub";
	case I64Multiply: return "i64.mul";
	case I64DivideS: return "i64.div_s";
	case I64DivideU: return "i64.div_u";
	case I64RemainderS: return "i64.rem_s";
	case I64RemainderU: return "i64.rem_u";
	case I64And: return "i64.and";
	case I64Or: return "i64.or";
	case I64Xor: return "i64.xor";
	case I64ShiftLeft: return "i64.shl";
	case I64ShiftRightS: return "i64.shr_s";
	case I64ShiftRightU: return "i64.shr_u";
	case I64RotateLeft: return "i64.rotl";
	case I64RotateRight: return "i64.rotr";
	case F32Absolute: return "f32.abs";
	case F32Negate: return "f32.neg";
	case F32Ceil: return "f32.ceil";
	case F32Floor: return "f32.floor";
	case F32Truncate: return "f32.trunc";
	case F32Nearest: return "f32.nearest";
	case F32SquareRoot: return "f32.sqrt";
	case F32Add: return "f32.add";
	case F32Subtract: return "f32.sub";
	case F32Multiply: return "f32.mul";
	case F32Divide: return "f32.div";
	case F32Minimum: return "f32.min";
	case F32Maximum: return "f32.max";
	case F32CopySign: return "f32.copysign";
	case F64Absolute: return "f64.abs";
	case F64Negate: return "f64.neg";
	case F64Ceil: return "f64.ceil";
	case F64Floor: return "f64.floor";
	case F64Truncate: return "f64.trunc";
	case F64Nearest: return "f64.nearest";
	case F64SquareRoot: return "f64.sqrt";
	case F64Add: return "f64.add";
	case F64Subtract: return "f64.sub";
	case F64Multiply: return "f64.mul";
	case F64Divide: return "f64.div";
	case F64Minimum: return "f64.min";
	case F64Maximum: return "f64.max";
	case F64CopySign: return "f64.copysign";
	case I32WrapI64: return "i32.wrap_i64";
	case I32TruncateF32S: return "i32.trunc_f32_s";
	case I32TruncateF32U: return "i32.trunc_f32_u";
	case I32TruncateF64S: return "i32.trunc_f64_s";
	case I32TruncateF64U: return "i32.trunc_f64_u";
	case I64ExtendI32S: return "i64.extend_i32_s";
	case I64ExtendI32U: return "i64.extend_i32_u";
	case I64TruncateF32S: return "i64.trunc_f32_s";
	case I64TruncateF32U: return "i64.trunc_f32_u";
	case I64TruncateF64S: return "i64.trunc_f64_s";
	case I64TruncateF64U: return "i64.trunc_f64_u";
	case F32ConvertI32S: return "f32.convert_i32_s";
	case F32ConvertI32U: return "f32.convert_i32_u";
	case F32ConvertI64S: return "f32.convert_i64_s";
	case F32ConvertI64U: return "f32.convert_i64_u";
	case F32DemoteF64: return "f32.demote_f64";
	case F64ConvertI32S: return "f64.convert_i32_s";
	case F64ConvertI32U: return "f64.convert_i32_u";
	case F64ConvertI64S: return "f64.convert_i64_s";
	case F64ConvertI64U: return "f64.convert_i64_u";
	case F64PromoteF32: return "f64.promote_f32";
	case I32ReinterpretF32: return "i32.reinterpret_f32";
	case I64ReinterpretF64: return "i64.reinterpret_f64";
	case F32ReinterpretI32: return "f32.reinterpret_i32";
	case F64ReinterpretI64: return "f64.reinterpret_i64";
	case I32Extend8s: return "i32.extend8_s";
	case I32Extend16s: return "i32.extend16_s";
	case I64Extend8s: return "i64.extend8_s";
	case I64Extend16s: return "i64.extend16_s";
	case I64Extend32s: return "i64.extend32_s";
	case I32TruncateSaturateF32S: return "i32.trunc_sat_f32_s";
	case I32TruncateSaturateF32U: return "i32.trunc_sat_f32_u";
	case I32TruncateSaturateF64S: return "i32.trunc_sat_f64_s";
	case I32TruncateSaturateF64U: return "i32.trunc_sat_f64_u";
	case I64TruncateSaturateF32S: return "i64.trunc_sat_f32_s";
	case I64TruncateSaturateF32U: return "i64.trunc_sat_f32_u";
	case I64TruncateSaturateF64S: return "i64.trunc_sat_f64_s";
	case I64TruncateSaturateF64U: return "i64.trunc_sat_f64_u";
	default: return "<unknown instruction type>";
	}
}

bool Instruction::operator==(const Instruction& other) const
{
	return type == other.type && mOperands == other.mOperands;
}

Index Instruction::index(sizeType n) const
{
	for (auto& op : mOperands) {
		if (auto idx = std::get_if<Index>(&op)) {
			if (n == 0) {
				return *idx;
			}
			n--;
		}
	}

	throw std::out_of_range{ "Instruction has no index operand at the requested position" };
}

DataType Instruction::blockDataType() const
{
	assert(type.isBlock());
	return operand<DataType>(0);
}

const InstructionSequence& Instruction::body() const
{
	assert(type.isBlock());
	return operand<InstructionSequence>(1);
}

const InstructionSequence& Instruction::elseBody() const
{
	assert(type == InstructionType::If);
	return operand<InstructionSequence>(2);
}

const LabelVector& Instruction::branchTableLabels() const
{
	assert(type == InstructionType::BranchTable);
	return operand<LabelVector>(0);
}

u32 Instruction::branchTableDefaultLabel() const
{
	// The default label is always stored as the last entry
	auto& labels = branchTableLabels();
	if (labels.empty()) {
		throw std::out_of_range{ "Branch table instruction has no default label" };
	}

	return labels.back();
}

u32 Instruction::memoryAlignment() const
{
	assert(type.isMemory());
	return operand<u32>(0);
}

u32 Instruction::memoryOffset() const
{
	assert(type.isMemory());
	return operand<u32>(1);
}

const ValTypeVector& Instruction::selectTypes() const
{
	assert(type == InstructionType::SelectFrom);
	return operand<ValTypeVector>(0);
}

ValType Instruction::referenceType() const
{
	assert(type == InstructionType::ReferenceNull);
	return operand<ValType>(0);
}

void Instruction::printOperand(std::ostream& out, const Operand& op, u32 indent) const
{
	std::visit([&](auto& x) {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, Index>) {
			out << " " << x.value;
		}
		else if constexpr (std::is_same_v<T, DataType>) {
			out << " " << (x.has_value() ? x->name() : "None");
		}
		else if constexpr (std::is_same_v<T, ValType>) {
			out << " " << x.name();
		}
		else if constexpr (std::is_same_v<T, ValTypeVector>) {
			out << " [";
			for (auto valType : x) {
				out << " " << valType.name();
			}
			out << " ]";
		}
		else if constexpr (std::is_same_v<T, LabelVector>) {
			out << " [";
			for (auto label : x) {
				out << " " << label;
			}
			out << " ]";
		}
		else if constexpr (std::is_same_v<T, InstructionSequence>) {
			out << std::endl;
			printInstructionSequence(out, x, indent + 1);
		}
		else {
			out << " " << x;
		}
	}, op);
}

void Instruction::printBranchTableInstruction(std::ostream& out) const
{
	assert(type == InstructionType::BranchTable);
	auto& labels = branchTableLabels();
	out << type.name() << " default: " << branchTableDefaultLabel() << " [";
	for (sizeType i = 0; i + 1 < labels.size(); i++) {
		out << " " << labels[i];
	}

	out << " ]" << std::endl;
}

void Instruction::print(std::ostream& out, u32 indent) const
{
	printIndentation(out, indent);

	if (type == InstructionType::BranchTable) {
		printBranchTableInstruction(out);
		return;
	}

	out << type.name();
	if (!type.isBlock()) {
		for (auto& op : mOperands) {
			printOperand(out, op, indent);
		}
		out << std::endl;
		return;
	}

	// Block instructions print their result type on the first line and each
	// nested sequence indented below it
	printOperand(out, mOperands.at(0), indent);
	printOperand(out, mOperands.at(1), indent);
	if (type == InstructionType::If && !elseBody().empty()) {
		printIndentation(out, indent);
		out << InstructionType{ InstructionType::Else }.name();
		printOperand(out, mOperands.at(2), indent);
	}

	printIndentation(out, indent);
	out << InstructionType{ InstructionType::End }.name() << std::endl;
}

void WASMDecoder::printInstructionSequence(std::ostream& out, const InstructionSequence& instructions, u32 indent)
{
	for (auto& instruction : instructions) {
		instruction.print(out, indent);
	}
}
