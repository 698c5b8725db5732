#include <stdexcept>

#include "decoding.h"
#include "introspection.h"
#include "error.h"

using namespace WASMDecoder;

template<typename TResult, typename TFunc>
TResult InstructionDecoder::reportingFailures(ByteSource& it, TFunc func) const
{
	if (!introspector) {
		return func();
	}

	introspector->onDecodingStart(it.position());
	try {
		return func();
	}
	catch (const DecodingError& e) {
		introspector->onDecodingFailed(e);
		throw;
	}
}

Instruction InstructionDecoder::decodeOne(ByteSource& it) const
{
	return reportingFailures<Instruction>(it, [&]() {
		return decodeInstruction(it, 0);
	});
}

DecodedBlock InstructionDecoder::decodeBlock(ByteSource& it) const
{
	return reportingFailures<DecodedBlock>(it, [&]() {
		return decodeBlockAtDepth(it, 0);
	});
}

Instruction InstructionDecoder::decodeInstruction(ByteSource& it, u32 depth) const
{
	auto position = it.position();
	auto opcode = it.nextU8();

	auto slot = table.lookup(opcode);
	if (!slot) {
		throw UnsupportedOpcodeError{ position, opcode };
	}

	// Extended opcodes are refined by a second byte
	auto entry = std::get_if<OpcodeEntry>(slot);
	if (!entry) {
		auto secondaryPosition = it.position();
		auto secondaryOpcode = it.nextU8();
		entry = table.lookup(opcode, secondaryOpcode);
		if (!entry) {
			throw UnsupportedOpcodeError{ secondaryPosition, opcode, secondaryOpcode };
		}
	}

	auto instruction = [&]() -> Instruction {
		switch (entry->rule) {
		case DecodeRule::Fields: return decodeFieldsInstruction(*entry, it, depth);
		case DecodeRule::Conditional: return decodeConditionalInstruction(*entry, it, depth);
		case DecodeRule::BranchTable: return decodeBranchTableInstruction(*entry, it);
		default:
			throw std::runtime_error{ "Could not decode instruction with unknown decoding rule" };
		}
	}();

	if (introspector) {
		introspector->onInstructionDecoded(depth, instruction);
	}

	return instruction;
}

DecodedBlock InstructionDecoder::decodeBlockAtDepth(ByteSource& it, u32 depth) const
{
	InstructionSequence instructions;
	while (true) {
		auto instruction = decodeInstruction(it, depth);

		// Terminators only signal the end of the block and are never stored
		if (instruction.opCode().isBlockTerminator()) {
			bool endedWithElse = instruction == InstructionType::Else;
			if (introspector) {
				introspector->onBlockDecoded(depth, instructions, endedWithElse);
			}

			return { std::move(instructions), endedWithElse };
		}

		instructions.emplace_back(std::move(instruction));
	}
}

u32 InstructionDecoder::enterNestedBlock(ByteSource& it, u32 depth) const
{
	auto nestedDepth = depth + 1;
	if (nestedDepth > mMaxNestingDepth) {
		throw NestingTooDeepError{ it.position(), mMaxNestingDepth };
	}

	return nestedDepth;
}

Instruction InstructionDecoder::decodeFieldsInstruction(const OpcodeEntry& entry, ByteSource& it, u32 depth) const
{
	if (entry.fields.empty()) {
		return { entry.type };
	}

	std::vector<Operand> operands;
	operands.reserve(entry.fields.size());
	for (auto& field : entry.fields) {
		operands.emplace_back(decodeField(field, it, depth));
	}

	return { entry.type, std::move(operands) };
}

Instruction InstructionDecoder::decodeConditionalInstruction(const OpcodeEntry& entry, ByteSource& it, u32 depth) const
{
	auto dataType = decodeDataType(it);

	auto nestedDepth = enterNestedBlock(it, depth);
	auto thenBlock = decodeBlockAtDepth(it, nestedDepth);

	// Without an 'else' boundary the otherwise arm is empty and no further
	// block follows in the stream
	InstructionSequence elseInstructions;
	if (thenBlock.endedWithElse) {
		auto elseBlock = decodeBlockAtDepth(it, nestedDepth);
		if (elseBlock.endedWithElse) {
			throw UnexpectedElseError{ it.position() };
		}
		elseInstructions = std::move(elseBlock.instructions);
	}

	std::vector<Operand> operands;
	operands.reserve(3);
	operands.emplace_back(std::in_place_type<DataType>, dataType);
	operands.emplace_back(std::in_place_type<InstructionSequence>, std::move(thenBlock.instructions));
	operands.emplace_back(std::in_place_type<InstructionSequence>, std::move(elseInstructions));

	return { entry.type, std::move(operands) };
}

Instruction InstructionDecoder::decodeBranchTableInstruction(const OpcodeEntry& entry, ByteSource& it) const
{
	// The vector of labels is followed by the default label, which is stored as last entry
	u64 numLabels = it.nextU32();
	LabelVector labels;
	for (u64 i = 0; i != numLabels + 1; i++) {
		labels.push_back(it.nextU32());
	}

	std::vector<Operand> operands;
	operands.emplace_back(std::in_place_type<LabelVector>, std::move(labels));

	return { entry.type, std::move(operands) };
}

Operand InstructionDecoder::decodeField(const FieldDescriptor& field, ByteSource& it, u32 depth) const
{
	switch (field.kind) {
	case FieldKind::U32:
		return Operand{ std::in_place_type<u32>, it.nextU32() };
	case FieldKind::I32:
		return Operand{ std::in_place_type<i32>, it.nextI32() };
	case FieldKind::I64:
		return Operand{ std::in_place_type<i64>, it.nextI64() };
	case FieldKind::F32:
		return Operand{ std::in_place_type<f32>, it.nextF32() };
	case FieldKind::F64:
		return Operand{ std::in_place_type<f64>, it.nextF64() };
	case FieldKind::Index: {
		// Range checks are left to the consumer
		auto idx = static_cast<sizeType>(it.nextU32());
		return Operand{ std::in_place_type<Index>, Index{ field.space, idx } };
	}
	case FieldKind::BlockType:
		return Operand{ std::in_place_type<DataType>, decodeDataType(it) };
	case FieldKind::RefType:
		return Operand{ std::in_place_type<ValType>, decodeReferenceType(it) };
	case FieldKind::ValTypeVector:
		return Operand{ std::in_place_type<ValTypeVector>, decodeValTypeVector(it) };
	case FieldKind::InstructionSequence: {
		auto nestedDepth = enterNestedBlock(it, depth);
		auto block = decodeBlockAtDepth(it, nestedDepth);
		return Operand{ std::in_place_type<InstructionSequence>, std::move(block.instructions) };
	}
	default:
		throw std::runtime_error{ "Could not decode field of unknown kind" };
	}
}

DataType InstructionDecoder::decodeDataType(ByteSource& it) const
{
	auto position = it.position();
	auto typeByte = it.nextU8();
	if (typeByte == ValType::EmptyBlockTypeByte) {
		return {};
	}

	auto valType = ValType::fromByte(typeByte);
	if (!valType.has_value()) {
		throw InvalidDataTypeError{ position, typeByte, "block type" };
	}

	return valType;
}

ValType InstructionDecoder::decodeReferenceType(ByteSource& it) const
{
	auto position = it.position();
	auto typeByte = it.nextU8();
	auto valType = ValType::fromByte(typeByte);
	if (!valType.has_value() || !valType->isReference()) {
		throw InvalidDataTypeError{ position, typeByte, "reference type" };
	}

	return *valType;
}

ValTypeVector InstructionDecoder::decodeValTypeVector(ByteSource& it) const
{
	auto numTypes = it.nextU32();
	ValTypeVector types;
	for (u32 i = 0; i != numTypes; i++) {
		auto position = it.position();
		auto typeByte = it.nextU8();
		auto valType = ValType::fromByte(typeByte);
		if (!valType.has_value()) {
			throw InvalidDataTypeError{ position, typeByte, "value type" };
		}
		types.push_back(*valType);
	}

	return types;
}
