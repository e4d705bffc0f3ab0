/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_PIECE_RANGE_HPP_INCLUDED
#define PIECESTREAM_PIECE_RANGE_HPP_INCLUDED

#include <cstdint>
#include <vector>
#include <iosfwd>

#include "piecestream/config.hpp"
#include "piecestream/units.hpp"
#include "piecestream/byte_range.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream {

	// an inclusive range of piece indices [first, last]
	struct PIECESTREAM_EXPORT piece_index_range
	{
		piece_index_t first{0};
		piece_index_t last{0};

		int num_pieces() const
		{ return static_cast<int>(last) - static_cast<int>(first) + 1; }

		bool contains(piece_index_t const p) const
		{ return p >= first && p <= last; }

		bool operator==(piece_index_range const& rhs) const
		{ return first == rhs.first && last == rhs.last; }
		bool operator!=(piece_index_range const& rhs) const
		{ return !(*this == rhs); }
	};

#if PIECESTREAM_USE_IOSTREAM
	PIECESTREAM_EXPORT std::ostream& operator<<(std::ostream& os, piece_index_range const& r);
#endif

	// the pieces overlapping ``r``. Fails with metadata_not_ready if
	// piece_length is not positive.
	PIECESTREAM_EXPORT piece_index_range piece_range(byte_range const& r
		, int piece_length, error_code& ec);

	// like piece_range(), but the last piece is extended by ``read_ahead``
	// bytes past the end of the last overlapping piece, clamped to the end of
	// the content. The first piece is never moved backwards.
	PIECESTREAM_EXPORT piece_index_range buffered_piece_range(byte_range const& r
		, int piece_length, std::int64_t read_ahead, std::int64_t content_length
		, error_code& ec);

	// the number of pieces needed to hold content_length bytes
	PIECESTREAM_EXPORT int num_pieces(std::int64_t content_length, int piece_length);

	// the size of the given piece. Every piece is piece_length bytes except
	// possibly the last one
	PIECESTREAM_EXPORT int piece_size(piece_index_t piece
		, std::int64_t content_length, int piece_length);

	// the byte offset of the first byte of the piece
	inline std::int64_t piece_offset(piece_index_t const piece, int const piece_length)
	{ return std::int64_t(static_cast<int>(piece)) * piece_length; }

	// the part of ``r`` that lies within ``piece``, as offsets into the
	// piece. Fails with invalid_piece_index if they don't overlap.
	PIECESTREAM_EXPORT byte_range bytes_in_piece(piece_index_t piece
		, byte_range const& r, int piece_length, error_code& ec);

	// compresses a per-piece presence vector into the runs of consecutive
	// present pieces, e.g. {1,1,1,0,0,1,1,0} -> [0,2] [5,6]
	PIECESTREAM_EXPORT std::vector<piece_index_range> piece_ranges(
		std::vector<bool> const& have);
}

#endif // PIECESTREAM_PIECE_RANGE_HPP_INCLUDED
