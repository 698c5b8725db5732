#pragma once

#include <exception>
#include <optional>
#include <ostream>
#include <string>

#include "util.h"

namespace WASMDecoder {

	class Error : public std::exception {
	public:
		Error(std::string m) : message{ std::move(m) } {}
		virtual ~Error() = default;

		virtual const char* what() const noexcept final { return message.c_str(); }
		virtual void print(std::ostream&) const = 0;

	protected:
		std::string message;
	};

	class DecodingError : public Error {
	public:
		DecodingError(u64 b, std::string m)
			: Error{ std::move(m) }, mBytePosition{ b } {}

		virtual void print(std::ostream& o) const override;

		u64 bytePosition() const { return mBytePosition; }

	private:
		u64 mBytePosition;
	};

	class UnexpectedEofError final : public DecodingError {
	public:
		UnexpectedEofError(u64 b, u64 requested);

		u64 requestedBytes() const { return mRequestedBytes; }

	private:
		u64 mRequestedBytes;
	};

	class UnsupportedOpcodeError final : public DecodingError {
	public:
		UnsupportedOpcodeError(u64 b, u8 op);
		UnsupportedOpcodeError(u64 b, u8 prefix, u8 op);

		// The byte that had no dispatch entry. For extended opcodes this is the second byte.
		u8 opcode() const { return mOpcode; }
		std::optional<u8> prefix() const { return mPrefix; }

	private:
		u8 mOpcode;
		std::optional<u8> mPrefix;
	};

	class InvalidDataTypeError final : public DecodingError {
	public:
		InvalidDataTypeError(u64 b, u8 typeByte, const char* expected);

		u8 typeByte() const { return mTypeByte; }

	private:
		u8 mTypeByte;
	};

	class MalformedIntegerError final : public DecodingError {
	public:
		MalformedIntegerError(u64 b, u32 bitWidth);
	};

	class NestingTooDeepError final : public DecodingError {
	public:
		NestingTooDeepError(u64 b, u32 limit);

		u32 limit() const { return mLimit; }

	private:
		u32 mLimit;
	};

	// A second 'else' arm inside a single conditional instruction
	class UnexpectedElseError final : public DecodingError {
	public:
		UnexpectedElseError(u64 b);
	};

	class OpcodeTableError final : public Error {
	public:
		OpcodeTableError(std::string s, u32 l, std::string m)
			: Error{ std::move(m) }, sourceName{ std::move(s) }, line{ l } {}

		virtual void print(std::ostream& o) const override;

	private:
		std::string sourceName;
		u32 line;
	};

	std::ostream& operator<<(std::ostream&, const Error&);
}
