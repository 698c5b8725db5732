#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "instruction.h"

namespace WASMDecoder {

	struct FieldDescriptor {
		FieldKind kind;
		IndexSpace space{ IndexSpace::Type }; // Only used by index fields

		static std::optional<FieldDescriptor> fromName(std::string_view);

		std::string name() const;
		bool operator==(const FieldDescriptor& other) const;
	};

	struct OpcodeEntry {
		u8 opcode;
		std::optional<u8> secondaryOpcode;
		InstructionType type;
		DecodeRule rule;
		std::vector<FieldDescriptor> fields;

		void print(std::ostream&) const;
	};

	// Unresolved table row, turned into an OpcodeEntry when the table is built.
	// The field list holds either space separated field kind names or a single
	// decoding directive (eg. "%conditional").
	struct OpcodeRow {
		u8 opcode;
		std::optional<u8> secondaryOpcode;
		std::string_view typeName;
		std::string_view fields;
	};

	class OpcodeTable {
	public:
		using SecondaryTable = std::unordered_map<u8, OpcodeEntry>;
		using PrimarySlot = std::variant<OpcodeEntry, SecondaryTable>;

		static const OpcodeTable& defaultTable();
		static std::span<const OpcodeRow> defaultRows();

		static OpcodeTable fromRows(std::span<const OpcodeRow>, std::string sourceName);
		static OpcodeTable fromText(std::istream&, std::string sourceName);
		static OpcodeTable fromFile(const std::string& path);

		OpcodeTable(OpcodeTable&&) = default;
		OpcodeTable(const OpcodeTable&) = delete;

		const PrimarySlot* lookup(u8) const;
		const OpcodeEntry* lookup(u8, u8) const;
		const OpcodeEntry* entryOf(InstructionType) const;

		sizeType size() const { return numEntries; }
		const std::string& sourceName() const { return mSourceName; }

		// Prints the table in the same text format read by fromText()
		void print(std::ostream&) const;

	private:
		OpcodeTable(std::string s) : mSourceName{ std::move(s) } {}

		void insertRow(const OpcodeRow&, u32 line);
		void insertEntry(OpcodeEntry, u32 line);
		void validateCompleteness() const;

		[[noreturn]] void throwTableError(u32 line, const std::string&) const;

		std::string mSourceName;
		std::unordered_map<u8, PrimarySlot> primaryTable;
		std::unordered_map<u32, std::pair<u8, std::optional<u8>>> opcodesByType;
		sizeType numEntries{ 0 };
	};
}
