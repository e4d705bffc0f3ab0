/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_DOWNLOAD_PRIORITY_HPP_INCLUDED
#define PIECESTREAM_DOWNLOAD_PRIORITY_HPP_INCLUDED

#include <cstdint>

#include "piecestream/units.hpp"

namespace piecestream {

namespace aux {
	struct piece_priority_tag;
}

	// the priority a piece is selected at. Higher values are downloaded
	// first.
	using piece_priority_t = aux::strong_typedef<std::uint8_t, aux::piece_priority_tag>;

	// the piece is not selected at all
	constexpr piece_priority_t none_priority{0};

	constexpr piece_priority_t low_priority{1};

	// the priority pieces have when nobody asked for them explicitly
	constexpr piece_priority_t normal_priority{2};

	constexpr piece_priority_t high_priority{3};

	// pieces needed by an active stream request
	constexpr piece_priority_t critical_priority{4};

	PIECESTREAM_EXPORT char const* priority_name(piece_priority_t p);
}

#endif // PIECESTREAM_DOWNLOAD_PRIORITY_HPP_INCLUDED
