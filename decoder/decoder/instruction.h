#pragma once

#include <optional>
#include <ostream>
#include <string_view>
#include <variant>
#include <vector>

#include "util.h"
#include "enum.h"
#include "forward.h"

namespace WASMDecoder {
	class InstructionType : public Enum <InstructionType> {
	public:
		enum TEnum {
			Unreachable,
			NoOperation,
			Block,
			Loop,
			If,
			Else,
			End,
			Branch,
			BranchIf,
			BranchTable,
			Return,
			Call,
			CallIndirect,
			Drop,
			Select,
			SelectFrom,
			LocalGet,
			LocalSet,
			LocalTee,
			GlobalGet,
			GlobalSet,
			ReferenceNull,
			ReferenceIsNull,
			ReferenceFunction,
			TableGet,
			TableSet,
			TableInit,
			ElementDrop,
			TableCopy,
			TableGrow,
			TableSize,
			TableFill,
			I32Load,
			I64Load,
			F32Load,
			F64Load,
			I32Load8s,
			I32Load8u,
			I32Load16s,
			I32Load16u,
			I64Load8s,
			I64Load8u,
			I64Load16s,
			I64Load16u,
			I64Load32s,
			I64Load32u,
			I32Store,
			I64Store,
			F32Store,
			F64Store,
			I32Store8,
			I32Store16,
			I64Store8,
			I64Store16,
			I64Store32,
			MemorySize,
			MemoryGrow,
			MemoryInit,
			DataDrop,
			MemoryCopy,
			MemoryFill,
			I32Const,
			I64Const,
			F32Const,
			F64Const,
			I32EqualZero,
			I32Equal,
			I32NotEqual,
			I32LesserS,
			I32LesserU,
			I32GreaterS,
			I32GreaterU,
			I32LesserEqualS,
			I32LesserEqualU,
			I32GreaterEqualS,
			I32GreaterEqualU,
			I64EqualZero,
			I64Equal,
			I64NotEqual,
			I64LesserS,
			I64LesserU,
			I64GreaterS,
			I64GreaterU,
			I64LesserEqualS,
			I64LesserEqualU,
			I64GreaterEqualS,
			I64GreaterEqualU,
			F32Equal,
			F32NotEqual,
			F32Lesser,
			F32Greater,
			F32LesserEqual,
			F32GreaterEqual,
			F64Equal,
			F64NotEqual,
			F64Lesser,
			F64Greater,
			F64LesserEqual,
			F64GreaterEqual,
			I32CountLeadingZeros,
			I32CountTrailingZeros,
			I32CountOnes,
			I32Add,
			I32Subtract,
			I32Multiply,
			I32DivideS,
			I32DivideU,
			I32RemainderS,
			I32RemainderU,
			I32And,
			I32Or,
			I32Xor,
			I32ShiftLeft,
			I32ShiftRightS,
			I32ShiftRightU,
			I32RotateLeft,
			I32RotateRight,
			I64CountLeadingZeros,
			I64CountTrailingZeros,
			I64CountOnes,
			I64Add,
			I64Subtract,
			I64Multiply,
			I64DivideS,
			I64DivideU,
			I64RemainderS,
			I64RemainderU,
			I64And,
			I64Or,
			I64Xor,
			I64ShiftLeft,
			I64ShiftRightS,
			I64ShiftRightU,
			I64RotateLeft,
			I64RotateRight,
			F32Absolute,
			F32Negate,
			F32Ceil,
			F32Floor,
			F32Truncate,
			F32Nearest,
			F32SquareRoot,
			F32Add,
			F32Subtract,
			F32Multiply,
			F32Divide,
			F32Minimum,
			F32Maximum,
			F32CopySign,
			F64Absolute,
			F64Negate,
			F64Ceil,
			F64Floor,
			F64Truncate,
			F64Nearest,
			F64SquareRoot,
			F64Add,
			F64Subtract,
			F64Multiply,
			F64Divide,
			F64Minimum,
			F64Maximum,
			F64CopySign,
			I32WrapI64,
			I32TruncateF32S,
			I32TruncateF32U,
			I32TruncateF64S,
			I32TruncateF64U,
			I64ExtendI32S,
			I64ExtendI32U,
			I64TruncateF32S,
			I64TruncateF32U,
			I64TruncateF64S,
			I64TruncateF64U,
			F32ConvertI32S,
			F32ConvertI32U,
			F32ConvertI64S,
			F32ConvertI64U,
			F32DemoteF64,
			F64ConvertI32S,
			F64ConvertI32U,
			F64ConvertI64S,
			F64ConvertI64U,
			F64PromoteF32,
			I32ReinterpretF32,
			I64ReinterpretF64,
			F32ReinterpretI32,
			F64ReinterpretI64,
			I32Extend8s,
			I32Extend16s,
			I64Extend8s,
			I64Extend16s,
			I64Extend32s,
			I32TruncateSaturateF32S,
			I32TruncateSaturateF32U,
			I32TruncateSaturateF64S,
			I32TruncateSaturateF64U,
			I64TruncateSaturateF32S,
			I64TruncateSaturateF32U,
			I64TruncateSaturateF64S,
			I64TruncateSaturateF64U,

			NumberOfItems
		};

		using Enum<InstructionType>::Enum;
		InstructionType(TEnum e) : Enum<InstructionType>{ e } {}

		// Looks up a type by its text format mnemonic eg. "local.get"
		static std::optional<InstructionType> fromName(std::string_view);

		bool isBlock() const;
		bool isBlockTerminator() const;
		bool isMemory() const;

		const char* name() const;
	};

	struct Index {
		IndexSpace space;
		sizeType value;

		bool operator==(const Index& other) const { return space == other.space && value == other.value; }
	};

	using InstructionSequence = std::vector<Instruction>;
	using LabelVector = std::vector<u32>;
	using ValTypeVector = std::vector<ValType>;

	using Operand = std::variant<
		u32,
		i32,
		i64,
		f32,
		f64,
		Index,
		DataType,
		ValType,
		ValTypeVector,
		LabelVector,
		InstructionSequence
	>;

	class Instruction {
	public:
		Instruction(InstructionType t)
			: type{ t } {}

		Instruction(InstructionType t, std::vector<Operand> o)
			: type{ t }, mOperands{ std::move(o) } {}

		InstructionType opCode() const { return type; }
		const char* name() const { return type.name(); }

		bool operator==(InstructionType t) const { return type == t; }
		bool operator==(const Instruction&) const;

		const std::vector<Operand>& operands() const { return mOperands; }
		sizeType operandCount() const { return mOperands.size(); }

		template<typename T>
		const T& operand(sizeType idx) const { return std::get<T>(mOperands.at(idx)); }

		// Returns the n-th index operand
		Index index(sizeType n= 0) const;

		DataType blockDataType() const;
		const InstructionSequence& body() const;
		const InstructionSequence& elseBody() const;

		const LabelVector& branchTableLabels() const;
		u32 branchTableDefaultLabel() const; // Throws if there are no labels

		u32 memoryAlignment() const;
		u32 memoryOffset() const;

		const ValTypeVector& selectTypes() const;
		ValType referenceType() const;

		void print(std::ostream&, u32 indent= 0) const;

	private:
		void printOperand(std::ostream&, const Operand&, u32 indent) const;
		void printBranchTableInstruction(std::ostream&) const;

		InstructionType type;
		std::vector<Operand> mOperands;
	};

	void printInstructionSequence(std::ostream&, const InstructionSequence&, u32 indent= 0);
}
