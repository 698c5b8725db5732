#pragma once

namespace WASMDecoder {
	class ByteSource;
	class Buffer;
	class BufferIterator;
	class StreamByteSource;

	class ValType;
	class IndexSpace;
	class FieldKind;
	class DecodeRule;

	class Error;
	class DecodingError;
	class UnexpectedEofError;
	class UnsupportedOpcodeError;
	class InvalidDataTypeError;
	class MalformedIntegerError;
	class NestingTooDeepError;
	class UnexpectedElseError;
	class OpcodeTableError;

	class InstructionType;
	class Instruction;
	struct Index;
	struct DecodedBlock;

	struct FieldDescriptor;
	struct OpcodeEntry;
	struct OpcodeRow;
	class OpcodeTable;

	class InstructionDecoder;

	class Introspector;
	class DebugLogger;
	class ConsoleLogger;
}
