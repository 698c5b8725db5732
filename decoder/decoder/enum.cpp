#include "enum.h"

using namespace WASMDecoder;

std::optional<ValType> ValType::fromByte(u8 byte)
{
	if (byte >= NumberOfItems) {
		return {};
	}

	auto valType = ValType::fromInt(byte);
	if (!valType.isValid()) {
		return {};
	}

	return valType;
}

bool ValType::isReference() const
{
	return value == FuncRef || value == ExternRef;
}

bool ValType::isValid() const
{
	switch (value) {
	case I32:
	case I64:
	case F32:
	case F64:
	case V128:
	case FuncRef:
	case ExternRef:
		return true;
	default:
		return false;
	}
}

const char* ValType::name() const
{
	switch (value) {
	case I32: return "I32";
	case I64: return "I64";
	case F32: return "F32";
	case F64: return "F64";
	case V128: return "V128";
	case FuncRef: return "FuncRef";
	case ExternRef: return "ExternRef";
	default: return "<unknown val type>";
	}
}

const char* IndexSpace::fieldName() const
{
	switch (value) {
	case Type: return "typeidx";
	case Function: return "funcidx";
	case Table: return "tableidx";
	case Local: return "localidx";
	case Global: return "globalidx";
	case Label: return "labelidx";
	case Element: return "elemidx";
	case Data: return "dataidx";
	case Memory: return "memidx";
	default: return "<unknown index field>";
	}
}

const char* FieldKind::name() const
{
	switch (value) {
	case U32: return "u32";
	case I32: return "i32";
	case I64: return "i64";
	case F32: return "f32";
	case F64: return "f64";
	case Index: return "idx";
	case BlockType: return "blocktype";
	case RefType: return "reftype";
	case ValTypeVector: return "valtype*";
	case InstructionSequence: return "instr*";
	default: return "<unknown field kind>";
	}
}

std::optional<DecodeRule> DecodeRule::fromDirective(std::string_view directive)
{
	if (directive == "%conditional") {
		return DecodeRule{ Conditional };
	}
	if (directive == "%branchtable") {
		return DecodeRule{ BranchTable };
	}

	return {};
}

const char* DecodeRule::directive() const
{
	switch (value) {
	case Conditional: return "%conditional";
	case BranchTable: return "%branchtable";
	default: return "";
	}
}
