#pragma once

#include <vector>
#include <string>
#include <istream>
#include <span>
#include <initializer_list>

#include "util.h"
#include "forward.h"

namespace WASMDecoder {

	// Blocking source of bytes. Implementations throw UnexpectedEofError instead
	// of waiting when fewer bytes are available than requested.
	class ByteSource {
	public:
		virtual ~ByteSource() = default;

		virtual u8 nextU8() = 0;
		virtual void nextBytes(std::span<u8>) = 0;

		// Number of bytes consumed so far
		virtual u64 position() const = 0;

		u32 nextU32(); // unsigned LEB128 encoding
		u64 nextU64();
		i32 nextI32(); // signed LEB128 encoding
		i64 nextI64();

		f32 nextF32();
		f64 nextF64();

		u32 nextLittleEndianU32();
		u64 nextLittleEndianU64();
	};

	class BufferIterator final : public ByteSource {
	public:
		BufferIterator() = default;
		BufferIterator(const BufferIterator&) = default;
		BufferIterator(const u8* b, const u8* e) : mBegin{ b }, mPosition{ b }, mEndPosition{ e } {}
		BufferIterator(const u8* b, const u8* p, const u8* e) : mBegin{ b }, mPosition{ p }, mEndPosition{ e } {}

		BufferIterator& operator=(const BufferIterator&) = default;

		sizeType remaining() const;
		bool hasNext(sizeType num = 1) const;
		u8 peekU8() const;

		virtual u8 nextU8() override;
		virtual void nextBytes(std::span<u8>) override;
		virtual u64 position() const override;

	private:
		const u8* mBegin{ nullptr };
		const u8* mPosition{ nullptr };
		const u8* mEndPosition{ nullptr };
	};

	class StreamByteSource final : public ByteSource {
	public:
		StreamByteSource(std::istream& s) : stream{ s } {}

		virtual u8 nextU8() override;
		virtual void nextBytes(std::span<u8>) override;
		virtual u64 position() const override { return consumedBytes; }

	private:
		std::istream& stream;
		u64 consumedBytes{ 0 };
	};

	class Buffer {
	public:
		static Buffer fromFile(const std::string&);
		static Buffer fromStream(std::istream&);

		Buffer() = default;
		Buffer(std::vector<u8> d) : mData{ std::move(d) } {}
		Buffer(std::initializer_list<u8> d) : mData{ d } {}
		Buffer(Buffer&& b) noexcept : mData{ std::move(b.mData) } {}

		Buffer& operator=(const Buffer&) = delete;
		Buffer& operator=(Buffer&&) noexcept;

		sizeType size() const { return mData.size(); }

		void appendU8(u8);
		void appendU32(u32);
		void appendI64(i64);

		BufferIterator iterator() const;
		BufferIterator iterator(sizeType offset) const;

		const u8* begin() const { return mData.data(); }
		const u8* end() const { return mData.data() + mData.size(); }

	private:
		std::vector<u8> mData;
	};
}
