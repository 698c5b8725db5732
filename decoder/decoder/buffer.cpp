#include <algorithm>
#include <array>
#include <bit>
#include <fstream>
#include <stdexcept>
#include <type_traits>

#include "buffer.h"
#include "error.h"

using namespace WASMDecoder;

template<typename T>
class LEB128Decoder {
public:
	using TUnsigned = std::make_unsigned_t<T>;

	static constexpr u32 BitWidth = sizeof(T) * 8;
	static constexpr u32 MaxByteCount = (BitWidth + 6) / 7;

	template<typename TStream>
	T decode(TStream& stream) const {
		TUnsigned value = 0;
		u32 shift = 0;
		for (u32 i = 0; i != MaxByteCount; i++) {
			auto byte = stream.nextU8();
			value |= static_cast<TUnsigned>(byte & 0x7F) << shift;
			shift += 7;

			if ((byte & 0x80) == 0) {
				// Sign extend from the last byte
				if constexpr (std::is_signed_v<T>) {
					if (shift < BitWidth && (byte & 0x40) != 0) {
						value |= ~static_cast<TUnsigned>(0) << shift;
					}
				}
				return static_cast<T>(value);
			}
		}

		throw MalformedIntegerError{ stream.position(), BitWidth };
	}
};

template<typename T>
class LEB128Encoder {
public:
	static void encode(std::vector<u8>& data, T value) {
		while (true) {
			u8 byte = value & 0x7F;
			value >>= 7; // Arithmetic shift for signed types

			bool done;
			if constexpr (std::is_signed_v<T>) {
				done = (value == 0 && (byte & 0x40) == 0) || (value == -1 && (byte & 0x40) != 0);
			}
			else {
				done = value == 0;
			}

			if (done) {
				data.push_back(byte);
				return;
			}
			data.push_back(byte | 0x80);
		}
	}
};


u32 ByteSource::nextU32()
{
	return LEB128Decoder<u32>{}.decode(*this);
}

u64 ByteSource::nextU64()
{
	return LEB128Decoder<u64>{}.decode(*this);
}

i32 ByteSource::nextI32()
{
	return LEB128Decoder<i32>{}.decode(*this);
}

i64 ByteSource::nextI64()
{
	return LEB128Decoder<i64>{}.decode(*this);
}

f32 ByteSource::nextF32()
{
	return std::bit_cast<f32>(nextLittleEndianU32());
}

f64 ByteSource::nextF64()
{
	return std::bit_cast<f64>(nextLittleEndianU64());
}

u32 ByteSource::nextLittleEndianU32()
{
	std::array<u8, 4> bytes;
	nextBytes(bytes);

	u32 value = 0;
	for (u32 i = 0; i != bytes.size(); i++) {
		value |= static_cast<u32>(bytes[i]) << (i * 8);
	}
	return value;
}

u64 ByteSource::nextLittleEndianU64()
{
	std::array<u8, 8> bytes;
	nextBytes(bytes);

	u64 value = 0;
	for (u32 i = 0; i != bytes.size(); i++) {
		value |= static_cast<u64>(bytes[i]) << (i * 8);
	}
	return value;
}

sizeType BufferIterator::remaining() const
{
	return mEndPosition - mPosition;
}

bool BufferIterator::hasNext(sizeType num) const
{
	return num <= remaining();
}

u8 BufferIterator::peekU8() const
{
	if (!hasNext()) {
		throw UnexpectedEofError{ position(), 1 };
	}
	return *mPosition;
}

u8 BufferIterator::nextU8()
{
	if (!hasNext()) {
		throw UnexpectedEofError{ position(), 1 };
	}
	return *(mPosition++);
}

void BufferIterator::nextBytes(std::span<u8> bytes)
{
	if (!hasNext(bytes.size())) {
		throw UnexpectedEofError{ position(), bytes.size() };
	}

	std::copy(mPosition, mPosition + bytes.size(), bytes.begin());
	mPosition += bytes.size();
}

u64 BufferIterator::position() const
{
	return mPosition - mBegin;
}

u8 StreamByteSource::nextU8()
{
	auto c = stream.get();
	if (c == std::istream::traits_type::eof()) {
		throw UnexpectedEofError{ consumedBytes, 1 };
	}

	consumedBytes++;
	return static_cast<u8>(c);
}

void StreamByteSource::nextBytes(std::span<u8> bytes)
{
	stream.read(reinterpret_cast<char*>(bytes.data()), bytes.size());
	auto numRead = static_cast<u64>(stream.gcount());
	if (numRead < bytes.size()) {
		auto position = consumedBytes;
		consumedBytes += numRead;
		throw UnexpectedEofError{ position, bytes.size() };
	}

	consumedBytes += numRead;
}

Buffer Buffer::fromFile(const std::string& path)
{
	std::ifstream file{ path, std::ios::binary };
	if (!file.is_open() || !file.good()) {
		throw std::runtime_error{ "Could not open file '" + path + "'" };
	}

	return fromStream(file);
}

Buffer Buffer::fromStream(std::istream& stream)
{
	std::vector<u8> vecBuffer{ std::istreambuf_iterator<char>{ stream }, {} };
	return { std::move(vecBuffer) };
}

Buffer& Buffer::operator=(Buffer&& other) noexcept
{
	mData = std::move(other.mData);
	return *this;
}

void Buffer::appendU8(u8 byte)
{
	mData.push_back(byte);
}

void Buffer::appendU32(u32 value)
{
	LEB128Encoder<u32>::encode(mData, value);
}

void Buffer::appendI64(i64 value)
{
	LEB128Encoder<i64>::encode(mData, value);
}

BufferIterator Buffer::iterator() const
{
	return { begin(), end() };
}

BufferIterator Buffer::iterator(sizeType offset) const
{
	if (offset > size()) {
		throw std::out_of_range{ "Offset lies beyond the end of the buffer" };
	}

	return { begin(), begin() + offset, end() };
}
