#pragma once

#include <ostream>

#include "util.h"
#include "forward.h"
#include "instruction.h"

namespace WASMDecoder {
	class Introspector {
	public:
		virtual ~Introspector() = default;

		virtual void onDecodingStart(u64 position) = 0;
		virtual void onInstructionDecoded(u32 depth, const Instruction&) = 0;
		virtual void onBlockDecoded(u32 depth, const InstructionSequence&, bool endedWithElse) = 0;
		virtual void onDecodingFailed(const DecodingError&) = 0;
	};

	class DebugLogger : public Introspector {
	public:
		virtual void onDecodingStart(u64 position) override;
		virtual void onInstructionDecoded(u32 depth, const Instruction&) override;
		virtual void onBlockDecoded(u32 depth, const InstructionSequence&, bool endedWithElse) override;
		virtual void onDecodingFailed(const DecodingError&) override;

	protected:
		virtual std::ostream& outStream() = 0;
		virtual bool doLoggingOfInstructions() = 0;
		virtual bool doLoggingOfBlocks() = 0;
	};

	class ConsoleLogger : public DebugLogger {
	public:
		ConsoleLogger(std::ostream& s, bool li= false, bool lb= true)
			: stream{ s }, logInstructions{ li }, logBlocks{ lb } {}

	protected:
		virtual std::ostream& outStream() override;
		virtual bool doLoggingOfInstructions() override;
		virtual bool doLoggingOfBlocks() override;

		std::ostream& stream;
		bool logInstructions;
		bool logBlocks;
	};
}
