/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/piece_range.hpp"
#include "piecestream/assert.hpp"

#include <algorithm>

#if PIECESTREAM_USE_IOSTREAM
#include <ostream>
#endif

namespace piecestream {

#if PIECESTREAM_USE_IOSTREAM
	std::ostream& operator<<(std::ostream& os, piece_index_range const& r)
	{
		return os << "[" << r.first << ", " << r.last << "]";
	}
#endif

	piece_index_range piece_range(byte_range const& r, int const piece_length
		, error_code& ec)
	{
		if (piece_length <= 0)
		{
			ec = errors::metadata_not_ready;
			return {};
		}
		PIECESTREAM_ASSERT_PRECOND(r.start >= 0);
		PIECESTREAM_ASSERT_PRECOND(r.start <= r.end);

		return { piece_index_t(static_cast<int>(r.start / piece_length))
			, piece_index_t(static_cast<int>(r.end / piece_length)) };
	}

	piece_index_range buffered_piece_range(byte_range const& r
		, int const piece_length, std::int64_t const read_ahead
		, std::int64_t const content_length, error_code& ec)
	{
		if (content_length <= 0)
		{
			ec = errors::metadata_not_ready;
			return {};
		}

		piece_index_range ret = piece_range(r, piece_length, ec);
		if (ec) return ret;

		// the last byte of the last piece, plus the read-ahead
		std::int64_t byte_end = (std::int64_t(static_cast<int>(ret.last)) + 1)
			* piece_length - 1;
		byte_end += std::max(read_ahead, std::int64_t(0));
		byte_end = std::min(byte_end, content_length - 1);

		piece_index_t const buffered_last(static_cast<int>(byte_end / piece_length));
		// a range that was already past the end is not shrunk
		ret.last = std::max(ret.last, buffered_last);
		return ret;
	}

	int num_pieces(std::int64_t const content_length, int const piece_length)
	{
		if (piece_length <= 0 || content_length <= 0) return 0;
		return static_cast<int>((content_length + piece_length - 1) / piece_length);
	}

	int piece_size(piece_index_t const piece, std::int64_t const content_length
		, int const piece_length)
	{
		PIECESTREAM_ASSERT_PRECOND(piece_length > 0);
		std::int64_t const offset = piece_offset(piece, piece_length);
		PIECESTREAM_ASSERT_PRECOND(offset < content_length);
		return static_cast<int>(std::min(std::int64_t(piece_length)
			, content_length - offset));
	}

	byte_range bytes_in_piece(piece_index_t const piece, byte_range const& r
		, int const piece_length, error_code& ec)
	{
		if (piece_length <= 0)
		{
			ec = errors::metadata_not_ready;
			return {};
		}

		std::int64_t const offset = piece_offset(piece, piece_length);
		std::int64_t const start = std::max(r.start, offset);
		std::int64_t const end = std::min(r.end, offset + piece_length - 1);
		if (start > end)
		{
			ec = errors::invalid_piece_index;
			return {};
		}
		return byte_range(start - offset, end - offset);
	}

	std::vector<piece_index_range> piece_ranges(std::vector<bool> const& have)
	{
		std::vector<piece_index_range> ret;
		int run_start = -1;
		int const n = int(have.size());

		for (int i = 0; i < n; ++i)
		{
			if (have[std::size_t(i)])
			{
				if (run_start < 0) run_start = i;
			}
			else if (run_start >= 0)
			{
				ret.push_back({piece_index_t(run_start), piece_index_t(i - 1)});
				run_start = -1;
			}
		}

		if (run_start >= 0)
			ret.push_back({piece_index_t(run_start), piece_index_t(n - 1)});
		return ret;
	}
}
