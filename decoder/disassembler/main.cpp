#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../decoder/decoding.h"
#include "../decoder/introspection.h"
#include "../decoder/error.h"

struct Options {
	std::string inputPath;
	std::optional<std::string> tablePath;
	WASMDecoder::sizeType offset{ 0 };
	WASMDecoder::u32 maxNestingDepth{ WASMDecoder::InstructionDecoder::DefaultMaxNestingDepth };
	bool decodeSingleInstruction{ false };
	bool dumpTable{ false };
	bool verbose{ false };
};

static void printUsage(std::ostream& out)
{
	out << "Usage: wasm-disassembler [options] <file | ->\n"
		<< "Decodes a block of instructions and prints it as an instruction tree.\n\n"
		<< "Options:\n"
		<< "  --table <file>     Load the opcode table from a text file\n"
		<< "  --dump-table       Print the opcode table and exit\n"
		<< "  --offset <n>       Start decoding at byte offset n\n"
		<< "  --max-depth <n>    Maximum block nesting depth (default "
		<< WASMDecoder::InstructionDecoder::DefaultMaxNestingDepth << ")\n"
		<< "  --single           Decode a single instruction instead of a block\n"
		<< "  --verbose          Log decoding progress\n";
}

template<typename T>
static std::optional<T> parseNumber(std::string_view text)
{
	int base = 10;
	if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
		text.remove_prefix(2);
		base = 16;
	}

	T value{};
	auto result = std::from_chars(text.data(), text.data() + text.size(), value, base);
	if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
		return {};
	}

	return value;
}

static std::optional<Options> parseArguments(int argc, char** argv)
{
	Options options;
	bool hasInput = false;

	for (int i = 1; i < argc; i++) {
		std::string_view arg{ argv[i] };
		auto nextValue = [&]() -> std::optional<std::string_view> {
			if (i + 1 >= argc) {
				std::cerr << "Missing value for option '" << arg << "'\n";
				return {};
			}
			return std::string_view{ argv[++i] };
		};

		if (arg == "--table") {
			auto value = nextValue();
			if (!value) return {};
			options.tablePath = std::string{ *value };
		}
		else if (arg == "--offset" || arg == "--max-depth") {
			auto value = nextValue();
			if (!value) return {};

			auto number = parseNumber<WASMDecoder::u64>(*value);
			if (!number || (arg == "--max-depth" && *number > 0xFFFFFFFF)) {
				std::cerr << "Invalid number '" << *value << "' for option '" << arg << "'\n";
				return {};
			}

			if (arg == "--offset") {
				options.offset = static_cast<WASMDecoder::sizeType>(*number);
			}
			else {
				options.maxNestingDepth = static_cast<WASMDecoder::u32>(*number);
			}
		}
		else if (arg == "--single") {
			options.decodeSingleInstruction = true;
		}
		else if (arg == "--dump-table") {
			options.dumpTable = true;
		}
		else if (arg == "--verbose") {
			options.verbose = true;
		}
		else if (arg == "--help" || arg == "-h") {
			return {};
		}
		else if (arg == "-" || !arg.starts_with('-')) {
			if (hasInput) {
				std::cerr << "Only a single input may be given\n";
				return {};
			}
			options.inputPath = std::string{ arg };
			hasInput = true;
		}
		else {
			std::cerr << "Unknown option '" << arg << "'\n";
			return {};
		}
	}

	if (!hasInput && !options.dumpTable) {
		std::cerr << "No input given\n";
		return {};
	}

	return options;
}

int main(int argc, char** argv) {
	auto options = parseArguments(argc, argv);
	if (!options) {
		printUsage(std::cerr);
		return 2;
	}

	try {
		std::optional<WASMDecoder::OpcodeTable> customTable;
		if (options->tablePath) {
			customTable.emplace(WASMDecoder::OpcodeTable::fromFile(*options->tablePath));
		}

		auto& table = customTable ? *customTable : WASMDecoder::OpcodeTable::defaultTable();
		if (options->dumpTable) {
			table.print(std::cout);
			return 0;
		}

		std::unique_ptr<WASMDecoder::ConsoleLogger> logger;
		if (options->verbose) {
			logger = std::make_unique<WASMDecoder::ConsoleLogger>(std::cerr, true, true);
		}

		WASMDecoder::InstructionDecoder decoder{ table, logger.get(), options->maxNestingDepth };

		auto buffer = options->inputPath == "-"
			? WASMDecoder::Buffer::fromStream(std::cin)
			: WASMDecoder::Buffer::fromFile(options->inputPath);
		auto it = buffer.iterator(options->offset);

		if (options->decodeSingleInstruction) {
			auto instruction = decoder.decodeOne(it);
			instruction.print(std::cout);
		}
		else {
			auto block = decoder.decodeBlock(it);
			WASMDecoder::printInstructionSequence(std::cout, block.instructions);
			std::cout << "; terminated by '" << (block.endedWithElse ? "else" : "end") << "'\n";
		}

		std::cout << "; decoded " << (it.position() - options->offset) << " bytes, "
			<< it.remaining() << " bytes remaining" << std::endl;
	}
	catch (WASMDecoder::Error& e) {
		std::cerr << "Caught decoder error: " << e << std::endl;
		return 1;
	}
	catch (std::exception& e) {
		std::cerr << "Caught generic error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
