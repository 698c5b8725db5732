#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "opcode_table.h"
#include "error.h"

using namespace WASMDecoder;

static const OpcodeRow builtinRows[] = {
	{ 0x00, {}, "unreachable", "" },
	{ 0x01, {}, "nop", "" },
	{ 0x02, {}, "block", "blocktype instr*" },
	{ 0x03, {}, "loop", "blocktype instr*" },
	{ 0x04, {}, "if", "%conditional" },
	{ 0x05, {}, "else", "" },
	{ 0x0B, {}, "end", "" },
	{ 0x0C, {}, "br", "labelidx" },
	{ 0x0D, {}, "br_if", "labelidx" },
	{ 0x0E, {}, "br_table", "%branchtable" },
	{ 0x0F, {}, "return", "" },
	{ 0x10, {}, "call", "funcidx" },
	{ 0x11, {}, "call_indirect", "typeidx tableidx" },
	{ 0x1A, {}, "drop", "" },
	{ 0x1B, {}, "select", "" },
	{ 0x1C, {}, "select_t", "valtype*" },
	{ 0x20, {}, "local.get", "localidx" },
	{ 0x21, {}, "local.set", "localidx" },
	{ 0x22, {}, "local.tee", "localidx" },
	{ 0x23, {}, "global.get", "globalidx" },
	{ 0x24, {}, "global.set", "globalidx" },
	{ 0x25, {}, "table.get", "tableidx" },
	{ 0x26, {}, "table.set", "tableidx" },
	{ 0x28, {}, "i32.load", "u32 u32" },
	{ 0x29, {}, "i64.load", "u32 u32" },
	{ 0x2A, {}, "f32.load", "u32 u32" },
	{ 0x2B, {}, "f64.load", "u32 u32" },
	{ 0x2C, {}, "i32.load8_s", "u32 u32" },
	{ 0x2D, {}, "i32.load8_u", "u32 u32" },
	{ 0x2E, {}, "i32.load16_s", "u32 u32" },
	{ 0x2F, {}, "i32.load16_u", "u32 u32" },
	{ 0x30, {}, "i64.load8_s", "u32 u32" },
	{ 0x31, {}, "i64.load8_u", "u32 u32" },
	{ 0x32, {}, "i64.load16_s", "u32 u32" },
	{ 0x33, {}, "i64.load16_u", "u32 u32" },
	{ 0x34, {}, "i64.load32_s", "u32 u32" },
	{ 0x35, {}, "i64.load32_u", "u32 u32" },
	{ 0x36, {}, "i32.store", "u32 u32" },
	{ 0x37, {}, "i64.store", "u32 u32" },
	{ 0x38, {}, "f32.store", "u32 u32" },
	{ 0x39, {}, "f64.store", "u32 u32" },
	{ 0x3A, {}, "i32.store8", "u32 u32" },
	{ 0x3B, {}, "i32.store16", "u32 u32" },
	{ 0x3C, {}, "i64.store8", "u32 u32" },
	{ 0x3D, {}, "i64.store16", "u32 u32" },
	{ 0x3E, {}, "i64.store32", "u32 u32" },
	{ 0x3F, {}, "memory.size", "memidx" },
	{ 0x40, {}, "memory.grow", "memidx" },
	{ 0x41, {}, "i32.const", "i32" },
	{ 0x42, {}, "i64.const", "i64" },
	{ 0x43, {}, "f32.const", "f32" },
	{ 0x44, {}, "f64.const", "f64" },
	{ 0x45, {}, "i32.eqz", "" },
	{ 0x46, {}, "i32.eq", "" },
	{ 0x47, {}, "i32.ne", "" },
	{ 0x48, {}, "i32.lt_s", "" },
	{ 0x49, {}, "i32.lt_u", "" },
	{ 0x4A, {}, "i32.gt_s", "" },
	{ 0x4B, {}, "i32.gt_u", "" },
	{ 0x4C, {}, "i32.le_s", "" },
	{ 0x4D, {}, "i32.le_u", "" },
	{ 0x4E, {}, "i32.ge_s", "" },
	{ 0x4F, {}, "i32.ge_u", "" },
	{ 0x50, {}, "i64.eqz", "" },
	{ 0x51, {}, "i64.eq", "" },
	{ 0x52, {}, "i64.ne", "" },
	{ 0x53, {}, "i64.lt_s", "" },
	{ 0x54, {}, "i64.lt_u", "" },
	{ 0x55, {}, "i64.gt_s", "" },
	{ 0x56, {}, "i64.gt_u", "" },
	{ 0x57, {}, "i64.le_s", "" },
	{ 0x58, {}, "i64.le_u", "" },
	{ 0x59, {}, "i64.ge_s", "" },
	{ 0x5A, {}, "i64.ge_u", "" },
	{ 0x5B, {}, "f32.eq", "" },
	{ 0x5C, {}, "f32.ne", "" },
	{ 0x5D, {}, "f32.lt", "" },
	{ 0x5E, {}, "f32.gt", "" },
	{ 0x5F, {}, "f32.le", "" },
	{ 0x60, {}, "f32.ge", "" },
	{ 0x61, {}, "f64.eq", "" },
	{ 0x62, {}, "f64.ne", "" },
	{ 0x63, {}, "f64.lt", "" },
	{ 0x64, {}, "f64.gt", "" },
	{ 0x65, {}, "f64.le", "" },
	{ 0x66, {}, "f64.ge", "" },
	{ 0x67, {}, "i32.clz", "" },
	{ 0x68, {}, "i32.ctz", "" },
	{ 0x69, {}, "i32.popcnt", "" },
	{ 0x6A, {}, "i32.add", "" },
	{ 0x6B, {}, "i32.sub", "" },
	{ 0x6C, {}, "i32.mul", "" },
	{ 0x6D, {}, "i32.div_s", "" },
	{ 0x6E, {}, "i32.div_u", "" },
	{ 0x6F, {}, "i32.rem_s", "" },
	{ 0x70, {}, "i32.rem_u", "" },
	{ 0x71, {}, "i32.and", "" },
	{ 0x72, {}, "i32.or", "" },
	{ 0x73, {}, "i32.xor", "" },
	{ 0x74, {}, "i32.shl", "" },
	{ 0x75, {}, "i32.shr_s", "" },
	{ 0x76, {}, "i32.shr_u", "" },
	{ 0x77, {}, "i32.rotl", "" },
	{ 0x78, {}, "i32.rotr", "" },
	{ 0x79, {}, "i64.clz", "" },
	{ 0x7A, {}, "i64.ctz", "" },
	{ 0x7B, {}, "i64.popcnt", "" },
	{ 0x7C, {}, "i64.add", "" },
	{ 0x7D, {}, "i64.sub", "" },
	{ 0x7E, {}, "i64.mul", "" },
	{ 0x7F, {}, "i64.div_s", "" },
	{ 0x80, {}, "i64.div_u", "" },
	{ 0x81, {}, "i64.rem_s", "" },
	{ 0x82, {}, "i64.rem_u", "" },
	{ 0x83, {}, "i64.and", "" },
	{ 0x84, {}, "i64.or", "" },
	{ 0x85, {}, "i64.xor", "" },
	{ 0x86, {}, "i64.shl", "" },
	{ 0x87, {}, "i64.shr_s", "" },
	{ 0x88, {}, "i64.shr_u", "" },
	{ 0x89, {}, "i64.rotl", "" },
	{ 0x8A, {}, "i64.rotr", "" },
	{ 0x8B, {}, "f32.abs", "" },
	{ 0x8C, {}, "f32.neg", "" },
	{ 0x8D, {}, "f32.ceil", "" },
	{ 0x8E, {}, "f32.floor", "" },
	{ 0x8F, {}, "f32.trunc", "" },
	{ 0x90, {}, "f32.nearest", "" },
	{ 0x91, {}, "f32.sqrt", "" },
	{ 0x92, {}, "f32.add", "" },
	{ 0x93, {}, "f32.sub", "" },
	{ 0x94, {}, "f32.mul", "" },
	{ 0x95, {}, "f32.div", "" },
	{ 0x96, {}, "f32.min", "" },
	{ 0x97, {}, "f32.max", "" },
	{ 0x98, {}, "f32.copysign", "" },
	{ 0x99, {}, "f64.abs", "" },
	{ 0x9A, {}, "f64.neg", "" },
	{ 0x9B, {}, "f64.ceil", "" },
	{ 0x9C, {}, "f64.floor", "" },
	{ 0x9D, {}, "f64.trunc", "" },
	{ 0x9E, {}, "f64.nearest", "" },
	{ 0x9F, {}, "f64.sqrt", "" },
	{ 0xA0, {}, "f64.add", "" },
	{ 0xA1, {}, "f64.sub", "" },
	{ 0xA2, {}, "f64.mul", "" },
	{ 0xA3, {}, "f64.div", "" },
	{ 0xA4, {}, "f64.min", "" },
	{ 0xA5, {}, "f64.max", "" },
	{ 0xA6, {}, "f64.copysign", "" },
	{ 0xA7, {}, "i32.wrap_i64", "" },
	{ 0xA8, {}, "i32.trunc_f32_s", "" },
	{ 0xA9, {}, "i32.trunc_f32_u", "" },
	{ 0xAA, {}, "i32.trunc_f64_s", "" },
	{ 0xAB, {}, "i32.trunc_f64_u", "" },
	{ 0xAC, {}, "i64.extend_i32_s", "" },
	{ 0xAD, {}, "i64.extend_i32_u", "" },
	{ 0xAE, {}, "i64.trunc_f32_s", "" },
	{ 0xAF, {}, "i64.trunc_f32_u", "" },
	{ 0xB0, {}, "i64.trunc_f64_s", "" },
	{ 0xB1, {}, "i64.trunc_f64_u", "" },
	{ 0xB2, {}, "f32.convert_i32_s", "" },
	{ 0xB3, {}, "f32.convert_i32_u", "" },
	{ 0xB4, {}, "f32.convert_i64_s", "" },
	{ 0xB5, {}, "f32.convert_i64_u", "" },
	{ 0xB6, {}, "f32.demote_f64", "" },
	{ 0xB7, {}, "f64.convert_i32_s", "" },
	{ 0xB8, {}, "f64.convert_i32_u", "" },
	{ 0xB9, {}, "f64.convert_i64_s", "" },
	{ 0xBA, {}, "f64.convert_i64_u", "" },
	{ 0xBB, {}, "f64.promote_f32", "" },
	{ 0xBC, {}, "i32.reinterpret_f32", "" },
	{ 0xBD, {}, "i64.reinterpret_f64", "" },
	{ 0xBE, {}, "f32.reinterpret_i32", "" },
	{ 0xBF, {}, "f64.reinterpret_i64", "" },
	{ 0xC0, {}, "i32.extend8_s", "" },
	{ 0xC1, {}, "i32.extend16_s", "" },
	{ 0xC2, {}, "i64.extend8_s", "" },
	{ 0xC3, {}, "i64.extend16_s", "" },
	{ 0xC4, {}, "i64.extend32_s", "" },
	{ 0xD0, {}, "ref.null", "reftype" },
	{ 0xD1, {}, "ref.is_null", "" },
	{ 0xD2, {}, "ref.func", "funcidx" },
	{ 0xFC, 0x00, "i32.trunc_sat_f32_s", "" },
	{ 0xFC, 0x01, "i32.trunc_sat_f32_u", "" },
	{ 0xFC, 0x02, "i32.trunc_sat_f64_s", "" },
	{ 0xFC, 0x03, "i32.trunc_sat_f64_u", "" },
	{ 0xFC, 0x04, "i64.trunc_sat_f32_s", "" },
	{ 0xFC, 0x05, "i64.trunc_sat_f32_u", "" },
	{ 0xFC, 0x06, "i64.trunc_sat_f64_s", "" },
	{ 0xFC, 0x07, "i64.trunc_sat_f64_u", "" },
	{ 0xFC, 0x08, "memory.init", "dataidx memidx" },
	{ 0xFC, 0x09, "data.drop", "dataidx" },
	{ 0xFC, 0x0A, "memory.copy", "memidx memidx" },
	{ 0xFC, 0x0B, "memory.fill", "memidx" },
	{ 0xFC, 0x0C, "table.init", "elemidx tableidx" },
	{ 0xFC, 0x0D, "elem.drop", "elemidx" },
	{ 0xFC, 0x0E, "table.copy", "tableidx tableidx" },
	{ 0xFC, 0x0F, "table.grow", "tableidx" },
	{ 0xFC, 0x10, "table.size", "tableidx" },
	{ 0xFC, 0x11, "table.fill", "tableidx" },
};

static std::string hexByte(u8 byte)
{
	std::ostringstream stream;
	stream << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << (u32)byte;
	return stream.str();
}

static std::vector<std::string_view> splitWhitespace(std::string_view text)
{
	std::vector<std::string_view> tokens;
	sizeType pos = 0;
	while (pos < text.size()) {
		auto begin = text.find_first_not_of(" \t\r", pos);
		if (begin == std::string_view::npos) {
			break;
		}

		auto end = text.find_first_of(" \t\r", begin);
		if (end == std::string_view::npos) {
			end = text.size();
		}

		tokens.push_back(text.substr(begin, end - begin));
		pos = end;
	}

	return tokens;
}

static std::optional<u8> parseByte(std::string_view token)
{
	int base = 10;
	if (token.size() > 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X')) {
		token.remove_prefix(2);
		base = 16;
	}

	u32 value = 0;
	auto result = std::from_chars(token.data(), token.data() + token.size(), value, base);
	if (result.ec != std::errc{} || result.ptr != token.data() + token.size() || value > 0xFF) {
		return {};
	}

	return static_cast<u8>(value);
}

std::optional<FieldDescriptor> FieldDescriptor::fromName(std::string_view name)
{
	if (name == "u32") return FieldDescriptor{ FieldKind::U32 };
	if (name == "i32") return FieldDescriptor{ FieldKind::I32 };
	if (name == "i64") return FieldDescriptor{ FieldKind::I64 };
	if (name == "f32") return FieldDescriptor{ FieldKind::F32 };
	if (name == "f64") return FieldDescriptor{ FieldKind::F64 };
	if (name == "blocktype") return FieldDescriptor{ FieldKind::BlockType };
	if (name == "reftype") return FieldDescriptor{ FieldKind::RefType };
	if (name == "valtype*") return FieldDescriptor{ FieldKind::ValTypeVector };
	if (name == "instr*") return FieldDescriptor{ FieldKind::InstructionSequence };

	if (name.ends_with("idx")) {
		for (u32 i = 0; i != IndexSpace::NumberOfItems; i++) {
			auto space = IndexSpace::fromInt(i);
			if (name == space.fieldName()) {
				return FieldDescriptor{ FieldKind::Index, space };
			}
		}
	}

	return {};
}

std::string FieldDescriptor::name() const
{
	if (kind == FieldKind::Index) {
		return space.fieldName();
	}

	return kind.name();
}

bool FieldDescriptor::operator==(const FieldDescriptor& other) const
{
	if (kind != other.kind) {
		return false;
	}

	return kind != FieldKind::Index || space == other.space;
}

void OpcodeEntry::print(std::ostream& out) const
{
	out << hexByte(opcode);
	if (secondaryOpcode.has_value()) {
		out << " " << hexByte(*secondaryOpcode);
	}

	out << " " << type.name();

	if (rule != DecodeRule::Fields) {
		out << " " << rule.directive();
		return;
	}

	for (auto& field : fields) {
		out << " " << field.name();
	}
}

const OpcodeTable& OpcodeTable::defaultTable()
{
	// Built once on first use and only read afterwards
	static const OpcodeTable table = fromRows(defaultRows(), "<builtin>");
	return table;
}

std::span<const OpcodeRow> OpcodeTable::defaultRows()
{
	return builtinRows;
}

OpcodeTable OpcodeTable::fromRows(std::span<const OpcodeRow> rows, std::string sourceName)
{
	OpcodeTable table{ std::move(sourceName) };

	u32 line = 1;
	for (auto& row : rows) {
		table.insertRow(row, line++);
	}

	table.validateCompleteness();
	return table;
}

OpcodeTable OpcodeTable::fromText(std::istream& stream, std::string sourceName)
{
	OpcodeTable table{ std::move(sourceName) };

	std::string lineText;
	u32 line = 0;
	while (std::getline(stream, lineText)) {
		line++;

		std::string_view content{ lineText };
		auto commentPos = content.find('#');
		if (commentPos != std::string_view::npos) {
			content = content.substr(0, commentPos);
		}

		auto tokens = splitWhitespace(content);
		if (tokens.empty()) {
			continue;
		}

		OpcodeRow row{};
		auto opcode = parseByte(tokens[0]);
		if (!opcode.has_value()) {
			table.throwTableError(line, "Expected opcode byte but found '" + std::string{ tokens[0] } + "'");
		}
		row.opcode = *opcode;

		sizeType nameTokenIdx = 1;
		if (tokens.size() > 1) {
			row.secondaryOpcode = parseByte(tokens[1]);
			if (row.secondaryOpcode.has_value()) {
				nameTokenIdx = 2;
			}
		}

		if (nameTokenIdx >= tokens.size()) {
			table.throwTableError(line, "Missing instruction name");
		}
		row.typeName = tokens[nameTokenIdx];

		// Re-join the remaining tokens to a single field list
		std::string fields;
		for (auto i = nameTokenIdx + 1; i < tokens.size(); i++) {
			if (!fields.empty()) {
				fields += ' ';
			}
			fields += tokens[i];
		}
		row.fields = fields;

		table.insertRow(row, line);
	}

	if (stream.bad()) {
		table.throwTableError(line, "Could not read table source");
	}

	table.validateCompleteness();
	return table;
}

OpcodeTable OpcodeTable::fromFile(const std::string& path)
{
	std::ifstream file{ path };
	if (!file.is_open() || !file.good()) {
		throw OpcodeTableError{ path, 0, "Could not open opcode table file" };
	}

	return fromText(file, path);
}

const OpcodeTable::PrimarySlot* OpcodeTable::lookup(u8 opcode) const
{
	auto it = primaryTable.find(opcode);
	if (it == primaryTable.end()) {
		return nullptr;
	}

	return &it->second;
}

const OpcodeEntry* OpcodeTable::lookup(u8 opcode, u8 secondaryOpcode) const
{
	auto slot = lookup(opcode);
	if (!slot) {
		return nullptr;
	}

	auto secondaryTable = std::get_if<SecondaryTable>(slot);
	if (!secondaryTable) {
		return nullptr;
	}

	auto it = secondaryTable->find(secondaryOpcode);
	if (it == secondaryTable->end()) {
		return nullptr;
	}

	return &it->second;
}

const OpcodeEntry* OpcodeTable::entryOf(InstructionType type) const
{
	auto it = opcodesByType.find(type);
	if (it == opcodesByType.end()) {
		return nullptr;
	}

	auto [opcode, secondaryOpcode] = it->second;
	if (secondaryOpcode.has_value()) {
		return lookup(opcode, *secondaryOpcode);
	}

	return &std::get<OpcodeEntry>(*lookup(opcode));
}

void OpcodeTable::print(std::ostream& out) const
{
	// Iterate in byte order to get a stable output
	for (u32 opcode = 0; opcode != 0x100; opcode++) {
		auto slot = lookup(static_cast<u8>(opcode));
		if (!slot) {
			continue;
		}

		if (auto entry = std::get_if<OpcodeEntry>(slot)) {
			entry->print(out);
			out << std::endl;
			continue;
		}

		auto& secondaryTable = std::get<SecondaryTable>(*slot);
		for (u32 secondaryOpcode = 0; secondaryOpcode != 0x100; secondaryOpcode++) {
			auto it = secondaryTable.find(static_cast<u8>(secondaryOpcode));
			if (it != secondaryTable.end()) {
				it->second.print(out);
				out << std::endl;
			}
		}
	}
}

void OpcodeTable::insertRow(const OpcodeRow& row, u32 line)
{
	auto type = InstructionType::fromName(row.typeName);
	if (!type.has_value()) {
		throwTableError(line, "Unknown instruction '" + std::string{ row.typeName } + "'");
	}

	OpcodeEntry entry{ row.opcode, row.secondaryOpcode, *type, DecodeRule::Fields, {} };

	auto fieldNames = splitWhitespace(row.fields);
	for (auto fieldName : fieldNames) {
		if (fieldName.starts_with('%')) {
			auto rule = DecodeRule::fromDirective(fieldName);
			if (!rule.has_value()) {
				throwTableError(line, "Unknown decoding directive '" + std::string{ fieldName } + "'");
			}
			if (fieldNames.size() != 1) {
				throwTableError(line, "Decoding directive '" + std::string{ fieldName } + "' cannot be combined with other fields");
			}
			entry.rule = *rule;
			continue;
		}

		auto field = FieldDescriptor::fromName(fieldName);
		if (!field.has_value()) {
			throwTableError(line, "Unknown field kind '" + std::string{ fieldName } + "'");
		}
		entry.fields.push_back(*field);
	}

	// The bespoke rules construct operands that only fit their own instruction
	if (entry.rule == DecodeRule::Conditional && entry.type != InstructionType::If) {
		throwTableError(line, "Conditional decoding is only supported for 'if'");
	}
	if (entry.rule == DecodeRule::BranchTable && entry.type != InstructionType::BranchTable) {
		throwTableError(line, "Branch table decoding is only supported for 'br_table'");
	}

	// Block instructions are read through accessors with a fixed operand layout
	static const std::vector<FieldDescriptor> blockFields{ { FieldKind::BlockType }, { FieldKind::InstructionSequence } };
	auto typeName = std::string{ entry.type.name() };
	switch (entry.type) {
	case InstructionType::If:
		if (entry.rule != DecodeRule::Conditional) {
			throwTableError(line, "Instruction '" + typeName + "' requires the '%conditional' directive");
		}
		break;
	case InstructionType::BranchTable:
		if (entry.rule != DecodeRule::BranchTable) {
			throwTableError(line, "Instruction '" + typeName + "' requires the '%branchtable' directive");
		}
		break;
	case InstructionType::Block:
	case InstructionType::Loop:
		if (entry.rule != DecodeRule::Fields || entry.fields != blockFields) {
			throwTableError(line, "Instruction '" + typeName + "' requires the fields 'blocktype instr*'");
		}
		break;
	default:
		break;
	}

	insertEntry(std::move(entry), line);
}

void OpcodeTable::insertEntry(OpcodeEntry entry, u32 line)
{
	if (opcodesByType.contains(entry.type)) {
		throwTableError(line, "Instruction '" + std::string{ entry.type.name() } + "' is mapped more than once");
	}

	auto type = entry.type;
	auto opcode = entry.opcode;
	auto secondaryOpcode = entry.secondaryOpcode;

	auto slotIt = primaryTable.find(opcode);
	if (!secondaryOpcode.has_value()) {
		if (slotIt != primaryTable.end()) {
			if (auto other = std::get_if<OpcodeEntry>(&slotIt->second)) {
				throwTableError(line, "Opcode " + hexByte(opcode) + " is already mapped to '" + other->type.name() + "'");
			}
			throwTableError(line, "Opcode " + hexByte(opcode) + " is already used as prefix of extended opcodes");
		}

		primaryTable.emplace(opcode, PrimarySlot{ std::in_place_type<OpcodeEntry>, std::move(entry) });
	}
	else {
		if (slotIt == primaryTable.end()) {
			slotIt = primaryTable.emplace(opcode, PrimarySlot{ std::in_place_type<SecondaryTable> }).first;
		}

		auto secondaryTable = std::get_if<SecondaryTable>(&slotIt->second);
		if (!secondaryTable) {
			auto& other = std::get<OpcodeEntry>(slotIt->second);
			throwTableError(line, "Opcode " + hexByte(opcode) + " is already mapped to '" + other.type.name() + "' and cannot be used as prefix");
		}

		if (auto it = secondaryTable->find(*secondaryOpcode); it != secondaryTable->end()) {
			throwTableError(line, "Opcode " + hexByte(opcode) + " " + hexByte(*secondaryOpcode) + " is already mapped to '" + it->second.type.name() + "'");
		}

		secondaryTable->emplace(*secondaryOpcode, std::move(entry));
	}

	opcodesByType.emplace(type, std::pair{ opcode, secondaryOpcode });
	numEntries++;
}

void OpcodeTable::validateCompleteness() const
{
	// Blocks cannot be terminated without an 'end' opcode
	if (!entryOf(InstructionType::End)) {
		throwTableError(0, "Table does not map the 'end' instruction");
	}
}

void OpcodeTable::throwTableError(u32 line, const std::string& msg) const
{
	throw OpcodeTableError{ mSourceName, line, msg };
}
