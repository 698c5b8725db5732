#pragma once

#include "buffer.h"
#include "instruction.h"
#include "opcode_table.h"

namespace WASMDecoder {

	// Contents of a block without its terminator. The flag records whether the
	// block was closed by 'else' instead of 'end'.
	struct DecodedBlock {
		InstructionSequence instructions;
		bool endedWithElse;
	};

	class InstructionDecoder {
	public:
		static constexpr u32 DefaultMaxNestingDepth = 1024;

		InstructionDecoder(const OpcodeTable& t = OpcodeTable::defaultTable(), Introspector* i = nullptr, u32 d = DefaultMaxNestingDepth)
			: table{ t }, introspector{ i }, mMaxNestingDepth{ d } {}

		Instruction decodeOne(ByteSource&) const;
		DecodedBlock decodeBlock(ByteSource&) const;

		const OpcodeTable& opcodeTable() const { return table; }
		u32 maxNestingDepth() const { return mMaxNestingDepth; }

	private:
		Instruction decodeInstruction(ByteSource&, u32 depth) const;
		DecodedBlock decodeBlockAtDepth(ByteSource&, u32 depth) const;
		u32 enterNestedBlock(ByteSource&, u32 depth) const;

		Instruction decodeFieldsInstruction(const OpcodeEntry&, ByteSource&, u32 depth) const;
		Instruction decodeConditionalInstruction(const OpcodeEntry&, ByteSource&, u32 depth) const;
		Instruction decodeBranchTableInstruction(const OpcodeEntry&, ByteSource&) const;

		Operand decodeField(const FieldDescriptor&, ByteSource&, u32 depth) const;
		DataType decodeDataType(ByteSource&) const;
		ValType decodeReferenceType(ByteSource&) const;
		ValTypeVector decodeValTypeVector(ByteSource&) const;

		template<typename TResult, typename TFunc>
		TResult reportingFailures(ByteSource&, TFunc) const;

		const OpcodeTable& table;
		Introspector* introspector;
		u32 mMaxNestingDepth;
	};
}
