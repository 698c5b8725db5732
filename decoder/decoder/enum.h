#pragma once

#include <cassert>
#include <optional>
#include <string_view>

#include "util.h"

namespace WASMDecoder {
	template<typename TSpecial, typename TStorage= u32>
	class Enum {
	public:
		using TEnumStorage = TStorage;

		template<typename T>
		static TSpecial fromInt(T x) {
			static_assert((u64)TSpecial::TEnum::NumberOfItems <= (u64)((TStorage)~0) + 1);
			assert(x < TSpecial::TEnum::NumberOfItems);
			return TSpecial{ (TStorage)x };
		}

		explicit Enum(TStorage v) : value{ v } {}
		operator int() const { return value; }

	protected:
		TStorage value;
	};

	class ValType : public Enum<ValType, u8> {
	public:
		enum TEnum {
			I32 = 0x7F,
			I64 = 0x7E,
			F32 = 0x7D,
			F64 = 0x7C,
			V128 = 0x7B,
			FuncRef = 0x70,
			ExternRef = 0x6F,
			NumberOfItems = 0x80
		};

		// Marks a block type without a result value
		static constexpr u8 EmptyBlockTypeByte = 0x40;

		using Enum<ValType, u8>::Enum;
		ValType(TEnum e) : Enum<ValType, u8>{ (u8)e } {}

		static std::optional<ValType> fromByte(u8);

		bool isReference() const;
		bool isValid() const;
		const char* name() const;
	};

	// Data type annotation of a block, absent if the block has no result
	using DataType = std::optional<ValType>;

	class IndexSpace : public Enum<IndexSpace> {
	public:
		enum TEnum {
			Type,
			Function,
			Table,
			Local,
			Global,
			Label,
			Element,
			Data,
			Memory,
			NumberOfItems
		};

		using Enum<IndexSpace>::Enum;
		IndexSpace(TEnum e) : Enum<IndexSpace>{ e } {}

		const char* fieldName() const;
	};

	class FieldKind : public Enum<FieldKind> {
	public:
		enum TEnum {
			U32,
			I32,
			I64,
			F32,
			F64,
			Index,
			BlockType,
			RefType,
			ValTypeVector,
			InstructionSequence,
			NumberOfItems
		};

		using Enum<FieldKind>::Enum;
		FieldKind(TEnum e) : Enum<FieldKind>{ e } {}

		const char* name() const;
	};

	class DecodeRule : public Enum<DecodeRule> {
	public:
		enum TEnum {
			Fields,
			Conditional,
			BranchTable,
			NumberOfItems
		};

		using Enum<DecodeRule>::Enum;
		DecodeRule(TEnum e) : Enum<DecodeRule>{ e } {}

		static std::optional<DecodeRule> fromDirective(std::string_view);

		const char* directive() const;
	};
}
