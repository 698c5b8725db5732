#include "introspection.h"
#include "error.h"

using namespace WASMDecoder;

void DebugLogger::onDecodingStart(u64 position)
{
	if (doLoggingOfBlocks()) {
		outStream() << "-> Start decoding @" << std::hex << position << std::dec << std::endl;
	}
}

void DebugLogger::onInstructionDecoded(u32 depth, const Instruction& instruction)
{
	if (doLoggingOfInstructions()) {
		auto& stream = outStream();
		stream << "  - [" << depth << "] " << instruction.name();
		if (instruction.operandCount() > 0) {
			stream << " (" << instruction.operandCount() << " operands)";
		}
		stream << std::endl;
	}
}

void DebugLogger::onBlockDecoded(u32 depth, const InstructionSequence& instructions, bool endedWithElse)
{
	if (doLoggingOfBlocks()) {
		outStream() << "-> Decoded block at depth " << depth << " containing " << instructions.size()
			<< " instructions terminated by '" << (endedWithElse ? "else" : "end") << "'" << std::endl;
	}
}

void DebugLogger::onDecodingFailed(const DecodingError& error)
{
	outStream() << "-> Decoding failed: " << error << std::endl;
}

std::ostream& ConsoleLogger::outStream()
{
	return stream;
}

bool ConsoleLogger::doLoggingOfInstructions()
{
	return logInstructions;
}

bool ConsoleLogger::doLoggingOfBlocks()
{
	return logBlocks;
}
