/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_BYTE_RANGE_HPP_INCLUDED
#define PIECESTREAM_BYTE_RANGE_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <string_view>
#include <iosfwd>

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream {

	// an inclusive range of bytes [start, end] of the content of a transfer.
	// start is never greater than end.
	struct PIECESTREAM_EXPORT byte_range
	{
		byte_range() = default;
		byte_range(std::int64_t s, std::int64_t e);

		std::int64_t start = 0;
		std::int64_t end = 0;

		// the number of bytes in the range
		std::int64_t size() const { return end - start + 1; }

		// true if the range lies entirely within content of the given length
		bool valid_for(std::int64_t content_length) const;

		// the value for a Content-Range response header,
		// ``bytes <start>-<end>/<content_length>``
		std::string content_range(std::int64_t content_length) const;

		bool operator==(byte_range const& rhs) const
		{ return start == rhs.start && end == rhs.end; }
		bool operator!=(byte_range const& rhs) const
		{ return !(*this == rhs); }
	};

#if PIECESTREAM_USE_IOSTREAM
	PIECESTREAM_EXPORT std::ostream& operator<<(std::ostream& os, byte_range const& r);
#endif

	// the Content-Range value of a 416 response, ``bytes */<content_length>``
	PIECESTREAM_EXPORT std::string unsatisfied_content_range(std::int64_t content_length);

	// the result of parsing a Range request header, before it is resolved
	// against the content length
	struct PIECESTREAM_EXPORT parsed_range
	{
		enum kind_t : std::uint8_t
		{
			// bytes=-N, the last N bytes
			suffix,
			// bytes=N-, from N to the end
			start_only,
			// bytes=N-M
			start_end
		};

		kind_t kind = start_end;

		// for start_only and start_end
		std::int64_t start = 0;

		// for start_end
		std::int64_t end = 0;

		// for suffix
		std::int64_t suffix_length = 0;
	};

	// parses the value of a Range header. Only a single range in the
	// ``bytes`` unit is supported. On failure ``ec`` is set to one of
	// invalid_range_format, multiple_ranges, invalid_range_number or
	// negative_range_value.
	PIECESTREAM_EXPORT parsed_range parse_range_header(std::string_view value
		, error_code& ec);

	// resolves a parsed range against the content length and truncates it to
	// at most ``max_chunk`` bytes. The resulting range always lies within
	// [0, content_length). Fails with range_not_satisfiable or empty_content.
	PIECESTREAM_EXPORT byte_range normalize_range(parsed_range const& r
		, std::int64_t content_length, std::int64_t max_chunk, error_code& ec);

	// the range served to a request without a Range header: the first
	// ``chunk`` bytes, or the whole content if it is shorter. content_length
	// must be positive.
	PIECESTREAM_EXPORT byte_range initial_chunk(std::int64_t content_length
		, std::int64_t chunk);

	// truncates ``r`` so it is no longer than ``max_chunk`` bytes and does
	// not extend beyond the content
	PIECESTREAM_EXPORT byte_range apply_chunk_limit(byte_range r
		, std::int64_t max_chunk, std::int64_t content_length);

	// parse and normalize in one step. An empty header selects the initial
	// chunk.
	PIECESTREAM_EXPORT byte_range resolve_range(std::string_view header
		, std::int64_t content_length, std::int64_t max_chunk
		, std::int64_t initial_chunk_size, error_code& ec);
}

#endif // PIECESTREAM_BYTE_RANGE_HPP_INCLUDED
