#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../decoder/decoding.h"
#include "../decoder/error.h"
#include "test_utils.h"

using namespace WASMDecoder;
using WASMDecoder::Tests::check;
using WASMDecoder::Tests::expectThrow;

namespace {

Instruction i32Const(i32 value) {
	return { InstructionType::I32Const, { Operand{ std::in_place_type<i32>, value } } };
}

Instruction localGet(sizeType idx) {
	return { InstructionType::LocalGet, { Operand{ std::in_place_type<Index>, Index{ IndexSpace::Local, idx } } } };
}

Operand blockType(DataType type) {
	return Operand{ std::in_place_type<DataType>, type };
}

Operand sequence(InstructionSequence instructions) {
	return Operand{ std::in_place_type<InstructionSequence>, std::move(instructions) };
}

bool containsTerminator(const InstructionSequence& instructions) {
	for (auto& instruction : instructions) {
		if (instruction.opCode().isBlockTerminator()) {
			return true;
		}

		for (auto& op : instruction.operands()) {
			auto nested = std::get_if<InstructionSequence>(&op);
			if (nested && containsTerminator(*nested)) {
				return true;
			}
		}
	}

	return false;
}

// local.get 0
// if (result i32)
//   local.get 0
//   i32.const 1
//   i32.sub
// else
//   i32.const 0
// end
// end
const Buffer& functionBody() {
	static const Buffer buffer{
		0x20, 0x00,
		0x04, 0x7F,
		0x20, 0x00,
		0x41, 0x01,
		0x6B,
		0x05,
		0x41, 0x00,
		0x0B,
		0x0B
	};
	return buffer;
}

void test_zero_operand_instructions() {
	InstructionDecoder decoder;
	auto& table = decoder.opcodeTable();

	for (u32 i = 0; i != InstructionType::NumberOfItems; i++) {
		auto entry = table.entryOf(InstructionType::fromInt(i));
		if (entry->rule != DecodeRule::Fields || !entry->fields.empty()) {
			continue;
		}

		Buffer buffer;
		buffer.appendU8(entry->opcode);
		if (entry->secondaryOpcode.has_value()) {
			buffer.appendU8(*entry->secondaryOpcode);
		}

		auto it = buffer.iterator();
		auto instruction = decoder.decodeOne(it);
		check(instruction == Instruction{ entry->type }, std::string{ "instruction should decode without operands: " } + entry->type.name());
		check(!it.hasNext(), std::string{ "opcode bytes should be consumed completely: " } + entry->type.name());
	}
}

void test_shared_prefix_decodes_identically() {
	InstructionDecoder decoder;
	Buffer first{ 0x20, 0x00, 0x41, 0x7F, 0x6A, 0x0B };
	Buffer second{ 0x20, 0x00, 0x41, 0x7F, 0x6A, 0xFF, 0xFF };

	auto firstIt = first.iterator();
	auto secondIt = second.iterator();
	for (u32 i = 0; i != 3; i++) {
		check(decoder.decodeOne(firstIt) == decoder.decodeOne(secondIt), "shared prefix should decode to identical instructions");
	}
	check(firstIt.position() == secondIt.position(), "shared prefix should consume the same number of bytes");
}

void test_block_terminators() {
	InstructionDecoder decoder;

	Buffer endBuffer{ 0x0B };
	auto endIt = endBuffer.iterator();
	auto endBlock = decoder.decodeBlock(endIt);
	check(endBlock.instructions.empty(), "'end' alone should yield an empty block");
	check(!endBlock.endedWithElse, "'end' should not be reported as 'else'");
	check(!endIt.hasNext(), "terminator should be consumed");

	Buffer elseBuffer{ 0x05 };
	auto elseIt = elseBuffer.iterator();
	auto elseBlock = decoder.decodeBlock(elseIt);
	check(elseBlock.instructions.empty(), "'else' alone should yield an empty block");
	check(elseBlock.endedWithElse, "'else' should be reported");
}

void test_conditional_with_else() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x04, 0x7F, 0x41, 0x01, 0x05, 0x41, 0x02, 0x0B };
	auto it = buffer.iterator();

	auto instruction = decoder.decodeOne(it);
	Instruction expected{ InstructionType::If, {
		blockType(ValType{ ValType::I32 }),
		sequence({ i32Const(1) }),
		sequence({ i32Const(2) })
	} };

	check(instruction == expected, "if with else arm should decode both arms");
	check(instruction.blockDataType() == ValType{ ValType::I32 }, "if should carry its result type");
	check(instruction.elseBody().size() == 1, "else arm should hold one instruction");
	check(!it.hasNext(), "if should consume its final 'end'");
}

void test_conditional_without_else() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x04, 0x40, 0x01, 0x0B, 0x41, 0x05 };
	auto it = buffer.iterator();

	auto instruction = decoder.decodeOne(it);
	Instruction expected{ InstructionType::If, {
		blockType(std::nullopt),
		sequence({ Instruction{ InstructionType::NoOperation } }),
		sequence({})
	} };

	check(instruction == expected, "if without else should have an empty else arm");
	check(!instruction.blockDataType().has_value(), "empty block type should decode to no data type");
	check(it.position() == 4, "no further block should be read after 'end'");
	check(decoder.decodeOne(it) == i32Const(5), "following instruction should remain in the stream");
}

void test_conditional_with_two_else_arms() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x04, 0x40, 0x05, 0x05 };
	auto it = buffer.iterator();

	auto error = expectThrow<UnexpectedElseError>([&]() { decoder.decodeOne(it); }, "second 'else' must be rejected");
	check(error.bytePosition() == 4, "error should be reported after the second 'else'");
}

void test_block_discards_else_terminator() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x02, 0x40, 0x01, 0x05, 0x0F };
	auto it = buffer.iterator();

	auto instruction = decoder.decodeOne(it);
	check(instruction == Instruction{ InstructionType::Block, { blockType(std::nullopt), sequence({ Instruction{ InstructionType::NoOperation } }) } },
		"block closed by 'else' should keep its body");
	check(it.position() == 4, "block should stop after its terminator");
	check(decoder.decodeOne(it) == InstructionType::Return, "stream should continue after the block");
}

void test_branch_table() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x0E, 0x03, 0x00, 0x01, 0x02, 0x05, 0x0F };
	auto it = buffer.iterator();

	auto instruction = decoder.decodeOne(it);
	check(instruction.branchTableLabels() == LabelVector{ 0, 1, 2, 5 }, "count three should read four labels");
	check(instruction.branchTableDefaultLabel() == 5, "default label should be stored last");
	check(it.position() == 6, "br_table should consume exactly its labels");
	check(decoder.decodeOne(it) == InstructionType::Return, "following instruction should remain in the stream");

	Buffer onlyDefault{ 0x0E, 0x00, 0x07 };
	auto defaultIt = onlyDefault.iterator();
	check(decoder.decodeOne(defaultIt).branchTableLabels() == LabelVector{ 7 }, "count zero should read only the default label");
}

void test_field_operands() {
	InstructionDecoder decoder;

	Buffer localGetBuffer{ 0x20, 0x85, 0x01 };
	auto localGetIt = localGetBuffer.iterator();
	check(decoder.decodeOne(localGetIt) == localGet(133), "local.get should read a LEB128 local index");

	Buffer callIndirectBuffer{ 0x11, 0x02, 0x00 };
	auto callIndirectIt = callIndirectBuffer.iterator();
	auto callIndirect = decoder.decodeOne(callIndirectIt);
	check(callIndirect.index(0) == Index{ IndexSpace::Type, 2 }, "call_indirect should read a type index first");
	check(callIndirect.index(1) == Index{ IndexSpace::Table, 0 }, "call_indirect should read a table index second");

	Buffer loadBuffer{ 0x28, 0x02, 0x10 };
	auto loadIt = loadBuffer.iterator();
	auto load = decoder.decodeOne(loadIt);
	check(load.memoryAlignment() == 2 && load.memoryOffset() == 16, "i32.load should read alignment and offset");

	Buffer constBuffer{ 0x42, 0x7F, 0x44, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F };
	auto constIt = constBuffer.iterator();
	check(decoder.decodeOne(constIt).operand<i64>(0) == -1, "i64.const should read a signed value");
	check(decoder.decodeOne(constIt).operand<f64>(0) == 1.5, "f64.const should read a little endian double");

	Buffer selectBuffer{ 0x1C, 0x02, 0x7F, 0x7D };
	auto selectIt = selectBuffer.iterator();
	check(decoder.decodeOne(selectIt).selectTypes() == ValTypeVector{ ValType::I32, ValType::F32 }, "select_t should read its value types");

	Buffer refNullBuffer{ 0xD0, 0x70 };
	auto refNullIt = refNullBuffer.iterator();
	check(decoder.decodeOne(refNullIt).referenceType() == ValType::FuncRef, "ref.null should read a reference type");

	Buffer memoryInitBuffer{ 0xFC, 0x08, 0x03, 0x00 };
	auto memoryInitIt = memoryInitBuffer.iterator();
	auto memoryInit = decoder.decodeOne(memoryInitIt);
	check(memoryInit == InstructionType::MemoryInit, "0xFC 0x08 should decode to memory.init");
	check(memoryInit.index(0) == Index{ IndexSpace::Data, 3 }, "memory.init should read a data index");
	check(memoryInit.index(1) == Index{ IndexSpace::Memory, 0 }, "memory.init should read a memory index");

	Buffer loopBuffer{ 0x03, 0x7E, 0x01, 0x0B };
	auto loopIt = loopBuffer.iterator();
	auto loop = decoder.decodeOne(loopIt);
	check(loop.blockDataType() == ValType{ ValType::I64 }, "loop should carry its result type");
	check(loop.body().size() == 1, "loop body should hold one instruction");
}

void test_invalid_types() {
	InstructionDecoder decoder;

	Buffer refNullBuffer{ 0xD0, 0x7F };
	auto refNullIt = refNullBuffer.iterator();
	auto refError = expectThrow<InvalidDataTypeError>([&]() { decoder.decodeOne(refNullIt); }, "ref.null with a number type must fail");
	check(refError.typeByte() == 0x7F && refError.bytePosition() == 1, "invalid reference type should be reported at its byte");

	Buffer blockBuffer{ 0x02, 0x55, 0x0B };
	auto blockIt = blockBuffer.iterator();
	auto blockError = expectThrow<InvalidDataTypeError>([&]() { decoder.decodeOne(blockIt); }, "unknown block type must fail");
	check(blockError.typeByte() == 0x55, "invalid block type byte should be reported");
}

void test_unsupported_opcodes() {
	InstructionDecoder decoder;

	Buffer primaryBuffer{ 0x06 };
	auto primaryIt = primaryBuffer.iterator();
	auto primaryError = expectThrow<UnsupportedOpcodeError>([&]() { decoder.decodeOne(primaryIt); }, "unmapped primary opcode must fail");
	check(primaryError.opcode() == 0x06, "unmapped primary opcode should be reported");
	check(!primaryError.prefix().has_value(), "primary opcode errors should have no prefix");
	check(primaryError.bytePosition() == 0, "error should point at the opcode byte");

	Buffer secondaryBuffer{ 0x01, 0xFC, 0x20 };
	auto secondaryIt = secondaryBuffer.iterator();
	auto secondaryError = expectThrow<UnsupportedOpcodeError>([&]() { decoder.decodeBlock(secondaryIt); }, "unmapped secondary opcode must fail");
	check(secondaryError.opcode() == 0x20, "unmapped secondary opcode should be reported");
	check(secondaryError.prefix() == u8{ 0xFC }, "prefix of the secondary opcode should be reported");
	check(secondaryError.bytePosition() == 2, "error should point at the secondary byte");

	Buffer nestedBuffer{ 0x02, 0x40, 0x01, 0xFD, 0x0B };
	auto nestedIt = nestedBuffer.iterator();
	auto nestedError = expectThrow<UnsupportedOpcodeError>([&]() { decoder.decodeOne(nestedIt); }, "unmapped opcode inside a block must fail");
	check(nestedError.opcode() == 0xFD, "nested unmapped opcode should propagate unchanged");
}

void test_truncated_input() {
	InstructionDecoder decoder;

	Buffer empty;
	auto emptyIt = empty.iterator();
	expectThrow<UnexpectedEofError>([&]() { decoder.decodeOne(emptyIt); }, "empty input must fail");

	Buffer prefixOnly{ 0xFC };
	auto prefixIt = prefixOnly.iterator();
	auto prefixError = expectThrow<UnexpectedEofError>([&]() { decoder.decodeOne(prefixIt); }, "missing secondary opcode must fail");
	check(prefixError.bytePosition() == 1, "eof should be reported after the prefix");

	Buffer nested;
	for (u32 i = 0; i != 50; i++) {
		nested.appendU8(0x02);
		nested.appendU8(0x40);
	}
	nested.appendU8(0x43);
	nested.appendU8(0x00);

	auto nestedIt = nested.iterator();
	auto nestedError = expectThrow<UnexpectedEofError>([&]() { decoder.decodeBlock(nestedIt); }, "truncated field in a nested block must fail");
	check(nestedError.bytePosition() == 101, "eof should be reported where the truncated field starts");
	check(nestedError.requestedBytes() == 4, "eof should report the f32 width");
}

void test_nesting_limit() {
	InstructionDecoder shallow{ OpcodeTable::defaultTable(), nullptr, 2 };
	check(shallow.maxNestingDepth() == 2, "decoder should keep its nesting limit");

	Buffer twoLevels{ 0x02, 0x40, 0x02, 0x40, 0x01, 0x0B, 0x0B };
	auto twoLevelsIt = twoLevels.iterator();
	auto outer = shallow.decodeOne(twoLevelsIt);
	check(outer.body().size() == 1 && outer.body()[0].body().size() == 1, "blocks within the limit should decode");

	Buffer threeLevels{ 0x02, 0x40, 0x04, 0x40, 0x02, 0x40, 0x0B, 0x0B, 0x0B };
	auto threeLevelsIt = threeLevels.iterator();
	auto error = expectThrow<NestingTooDeepError>([&]() { shallow.decodeOne(threeLevelsIt); }, "blocks beyond the limit must fail");
	check(error.limit() == 2, "error should report the limit");

	Buffer deep;
	for (u32 i = 0; i != 2 * InstructionDecoder::DefaultMaxNestingDepth; i++) {
		deep.appendU8(0x03);
		deep.appendU8(0x40);
	}

	InstructionDecoder decoder;
	auto deepIt = deep.iterator();
	expectThrow<NestingTooDeepError>([&]() { decoder.decodeBlock(deepIt); }, "default limit should stop runaway nesting");
}

void test_function_body() {
	InstructionDecoder decoder;
	auto it = functionBody().iterator();

	auto block = decoder.decodeBlock(it);
	check(!block.endedWithElse, "function body should end with 'end'");
	check(!it.hasNext(), "function body should be consumed completely");
	check(!containsTerminator(block.instructions), "terminators should never be stored in sequences");

	InstructionSequence expected{
		localGet(0),
		Instruction{ InstructionType::If, {
			blockType(ValType{ ValType::I32 }),
			sequence({ localGet(0), i32Const(1), Instruction{ InstructionType::I32Subtract } }),
			sequence({ i32Const(0) })
		} }
	};
	check(block.instructions == expected, "function body should decode to the expected tree");

	std::ostringstream out;
	printInstructionSequence(out, block.instructions);
	check(out.str() ==
		"local.get 0\n"
		"if I32\n"
		"  local.get 0\n"
		"  i32.const 1\n"
		"  i32.sub\n"
		"else\n"
		"  i32.const 0\n"
		"end\n", "function body should print as indented text");
}

void test_print_branch_table() {
	InstructionDecoder decoder;
	Buffer buffer{ 0x0E, 0x03, 0x00, 0x01, 0x02, 0x05 };
	auto it = buffer.iterator();

	std::ostringstream out;
	decoder.decodeOne(it).print(out);
	check(out.str() == "br_table default: 5 [ 0 1 2 ]\n", "br_table should print its default label first");
}

void test_branch_table_without_labels() {
	Instruction instruction{ InstructionType::BranchTable, { Operand{ std::in_place_type<LabelVector> } } };
	expectThrow<std::out_of_range>([&]() { instruction.branchTableDefaultLabel(); }, "br_table without labels has no default label");

	std::ostringstream out;
	expectThrow<std::out_of_range>([&]() { instruction.print(out); }, "br_table without labels cannot be printed");
}

void test_custom_table() {
	std::istringstream text{
		"0x0B end\n"
		"0x10 i32.const i32\n"
		"0x11 block blocktype instr*\n"
	};
	auto table = OpcodeTable::fromText(text, "custom");
	InstructionDecoder decoder{ table };

	Buffer buffer{ 0x11, 0x40, 0x10, 0x05, 0x0B, 0x41 };
	auto it = buffer.iterator();
	auto block = decoder.decodeOne(it);
	check(block.body().size() == 1 && block.body()[0] == i32Const(5), "remapped opcodes should decode");

	auto error = expectThrow<UnsupportedOpcodeError>([&]() { decoder.decodeOne(it); }, "opcodes missing from the table must fail");
	check(error.opcode() == 0x41, "default opcode should be unknown to the custom table");
}

void test_stream_source() {
	InstructionDecoder decoder;
	auto& body = functionBody();
	std::istringstream stream{ std::string(body.begin(), body.end()) };
	StreamByteSource source{ stream };

	auto block = decoder.decodeBlock(source);
	check(block.instructions.size() == 2, "stream input should decode like buffered input");
	check(source.position() == body.size(), "stream input should be consumed completely");
}

void test_concurrent_decoding() {
	InstructionDecoder decoder;
	auto reference = functionBody().iterator();
	auto expected = decoder.decodeBlock(reference).instructions;

	std::vector<std::thread> threads;
	std::vector<int> results(4, 0);
	for (sizeType i = 0; i != results.size(); i++) {
		threads.emplace_back([&, i]() {
			for (u32 round = 0; round != 100; round++) {
				auto it = functionBody().iterator();
				if (decoder.decodeBlock(it).instructions != expected) {
					return;
				}
			}
			results[i] = 1;
		});
	}

	for (auto& thread : threads) {
		thread.join();
	}

	for (auto result : results) {
		check(result == 1, "shared decoder should produce identical results on every thread");
	}
}

} // namespace

int main() {
	test_zero_operand_instructions();
	test_shared_prefix_decodes_identically();
	test_block_terminators();
	test_conditional_with_else();
	test_conditional_without_else();
	test_conditional_with_two_else_arms();
	test_block_discards_else_terminator();
	test_branch_table();
	test_field_operands();
	test_invalid_types();
	test_unsupported_opcodes();
	test_truncated_input();
	test_nesting_limit();
	test_function_body();
	test_print_branch_table();
	test_branch_table_without_labels();
	test_custom_table();
	test_stream_source();
	test_concurrent_decoding();
	std::cout << "decoding tests passed\n";
	return 0;
}
