#include <iomanip>
#include <sstream>

#include "error.h"

using namespace WASMDecoder;

static std::string hexByte(u8 byte)
{
	std::ostringstream stream;
	stream << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << (u32)byte;
	return stream.str();
}

void DecodingError::print(std::ostream& o) const
{
	o << "Decoding error @" << std::hex << mBytePosition << std::dec << ": " << message;
}

UnexpectedEofError::UnexpectedEofError(u64 b, u64 requested)
	: DecodingError{ b, "Unexpected end of input while reading " + std::to_string(requested) + " byte(s)" },
	mRequestedBytes{ requested } {}

UnsupportedOpcodeError::UnsupportedOpcodeError(u64 b, u8 op)
	: DecodingError{ b, "Unsupported opcode " + hexByte(op) }, mOpcode{ op } {}

UnsupportedOpcodeError::UnsupportedOpcodeError(u64 b, u8 prefix, u8 op)
	: DecodingError{ b, "Unsupported secondary opcode " + hexByte(op) + " after prefix " + hexByte(prefix) },
	mOpcode{ op }, mPrefix{ prefix } {}

InvalidDataTypeError::InvalidDataTypeError(u64 b, u8 typeByte, const char* expected)
	: DecodingError{ b, "Invalid type byte " + hexByte(typeByte) + ", expected " + expected },
	mTypeByte{ typeByte } {}

MalformedIntegerError::MalformedIntegerError(u64 b, u32 bitWidth)
	: DecodingError{ b, "LEB128 encoding exceeds the maximum length of a " + std::to_string(bitWidth) + "bit integer" } {}

NestingTooDeepError::NestingTooDeepError(u64 b, u32 limit)
	: DecodingError{ b, "Block nesting exceeds the limit of " + std::to_string(limit) + " levels" }, mLimit{ limit } {}

UnexpectedElseError::UnexpectedElseError(u64 b)
	: DecodingError{ b, "Conditional instruction has more than one 'else' arm" } {}

void OpcodeTableError::print(std::ostream& o) const
{
	o << "Opcode table error in '" << sourceName << "'";
	if (line != 0) {
		o << " line " << line;
	}

	o << ": " << message;
}

std::ostream& WASMDecoder::operator<<(std::ostream& out, const Error& e)
{
	e.print(out);
	return out;
}
