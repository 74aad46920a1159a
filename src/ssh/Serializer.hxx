// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Bytes.hxx"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace SSH {

/**
 * Builds a byte string in the SSH wire format (RFC 4251 section 5).
 *
 * The buffer grows as needed; spans returned by BeginWriteN(),
 * WriteN(), Since() and Finish() are invalidated by the next write.
 */
class Serializer {
	std::vector<std::byte> buffer;
	std::size_t position = 0;

public:
	using Marker = std::size_t;

	Serializer() noexcept = default;

	Serializer(const Serializer &) = delete;
	Serializer &operator=(const Serializer &) = delete;

	/**
	 * Obtain a writable buffer of the specified size at the
	 * current position.  The data becomes part of the output
	 * only after CommitWriteN().
	 */
	std::span<std::byte> BeginWriteN(std::size_t size) {
		if (buffer.size() < position + size)
			buffer.resize(position + size);
		return std::span{buffer}.subspan(position, size);
	}

	void CommitWriteN(std::size_t size) noexcept {
		assert(position + size <= buffer.size());
		position += size;
	}

	std::span<std::byte> WriteN(std::size_t size) {
		auto dest = BeginWriteN(size);
		CommitWriteN(size);
		return dest;
	}

	void WriteN(std::span<const std::byte> src) {
		auto dest = WriteN(src.size());
		std::copy(src.begin(), src.end(), dest.begin());
	}

	void WriteU8(uint_least8_t value) {
		WriteN(1).front() = static_cast<std::byte>(value);
	}

	void WriteU32(uint_least32_t value) {
		auto dest = WriteN(4);
		dest[0] = static_cast<std::byte>(value >> 24);
		dest[1] = static_cast<std::byte>(value >> 16);
		dest[2] = static_cast<std::byte>(value >> 8);
		dest[3] = static_cast<std::byte>(value);
	}

	void WriteU64(uint_least64_t value) {
		WriteU32(static_cast<uint_least32_t>(value >> 32));
		WriteU32(static_cast<uint_least32_t>(value));
	}

	void WriteLengthEncoded(std::span<const std::byte> src) {
		if (src.size() > std::numeric_limits<uint_least32_t>::max())
			throw std::length_error{"String too long"};

		WriteU32(src.size());
		WriteN(src);
	}

	void WriteString(std::string_view src) {
		WriteLengthEncoded(AsBytes(src));
	}

	/**
	 * Write the body of an "mpint" (without the length prefix):
	 * leading zeroes are stripped and a single null byte is
	 * inserted if the most significant bit is set.
	 */
	void WriteBignum2(std::span<const std::byte> src);

	/**
	 * Convert the unsigned big-endian number which was written
	 * with BeginWriteN() to an "mpint" body and commit it.
	 */
	void CommitBignum2(std::size_t size);

	/**
	 * Reserve space for a 32 bit length prefix.  Pass the
	 * returned marker to CommitLength() after the payload has
	 * been written.
	 */
	Marker PrepareLength() {
		const Marker m = position;
		WriteU32(0);
		return m;
	}

	void CommitLength(Marker m) {
		assert(m + 4 <= position);

		const std::size_t length = position - m - 4;
		if (length > std::numeric_limits<uint_least32_t>::max())
			throw std::length_error{"String too long"};

		buffer[m] = static_cast<std::byte>(length >> 24);
		buffer[m + 1] = static_cast<std::byte>(length >> 16);
		buffer[m + 2] = static_cast<std::byte>(length >> 8);
		buffer[m + 3] = static_cast<std::byte>(length);
	}

	/**
	 * Generate an opaque marker for the current position.
	 */
	constexpr Marker Mark() const noexcept {
		return position;
	}

	/**
	 * Returns a view on the data added since Mark() was called.
	 */
	std::span<const std::byte> Since(Marker m) const noexcept {
		assert(m <= position);
		return std::span{buffer}.subspan(m, position - m);
	}

	constexpr std::size_t size() const noexcept {
		return position;
	}

	std::span<const std::byte> Finish() const noexcept {
		return std::span{buffer}.first(position);
	}

	/**
	 * Move the serialized data out of this object.  The
	 * #Serializer is empty afterwards.
	 */
	std::vector<std::byte> Release() noexcept {
		buffer.resize(position);
		position = 0;
		return std::move(buffer);
	}
};

} // namespace SSH
