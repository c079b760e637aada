// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#ifndef HTTP_RANGE_HXX
#define HTTP_RANGE_HXX

#include <cstdint>
#include <string_view>

/**
 * The result of parsing a "Range" request header against a resource
 * of a known size.  Only a single byte range is supported.
 */
struct HttpRangeRequest {
	enum class Type : uint8_t {
		/**
		 * No "Range" header was parsed; the whole resource
		 * shall be sent.
		 */
		NONE,

		/**
		 * A satisfiable range was parsed; #first and #last
		 * describe it.
		 */
		VALID,

		/**
		 * The "Range" header was malformed or not
		 * satisfiable; the response shall be "416 Range Not
		 * Satisfiable".
		 */
		INVALID,
	} type = Type::NONE;

	/**
	 * The first and the last byte of the range (both inclusive).
	 * Only valid if #type is #Type::VALID.
	 */
	uint64_t first = 0, last = 0;

	/**
	 * The total size of the resource.
	 */
	uint64_t size;

	explicit constexpr HttpRangeRequest(uint64_t _size) noexcept
		:size(_size) {}

	/**
	 * Parse the value of a "Range" request header.  Accepted forms
	 * are "bytes=FIRST-LAST", "bytes=FIRST-" (until the end of the
	 * resource) and the suffix form "bytes=-LENGTH" (the last
	 * LENGTH bytes).
	 *
	 * After returning, #type is either #Type::VALID or
	 * #Type::INVALID.
	 */
	void ParseRangeHeader(std::string_view value) noexcept;

	constexpr bool IsValid() const noexcept {
		return type == Type::VALID;
	}

	constexpr bool IsInvalid() const noexcept {
		return type == Type::INVALID;
	}

	/**
	 * The number of bytes in the range.
	 */
	constexpr uint64_t GetLength() const noexcept {
		return last - first + 1;
	}

private:
	void SetValid(uint64_t _first, uint64_t _last) noexcept {
		type = Type::VALID;
		first = _first;
		last = _last;
	}

	void SetInvalid() noexcept {
		type = Type::INVALID;
	}
};

#endif
