/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/piece_engine.hpp"
#include "piecestream/download_priority.hpp"

#include <algorithm>

namespace piecestream {

	chunk_store::~chunk_store() = default;
	byte_reader::~byte_reader() = default;
	piece_engine::~piece_engine() = default;

	char const* priority_name(piece_priority_t const p)
	{
		switch (static_cast<std::uint8_t>(p))
		{
			case 0: return "none";
			case 1: return "low";
			case 2: return "normal";
			case 3: return "high";
			case 4: return "critical";
		}
		return "unknown";
	}

	bool is_downloaded(piece_engine const& e, piece_index_t const piece)
	{
		auto const rec = e.piece_status(piece);
		return rec && rec->downloaded();
	}

	bool all_downloaded(piece_engine const& e, piece_index_range const r)
	{
		for (piece_index_t i = r.first; i <= r.last; ++i)
		{
			if (!is_downloaded(e, i)) return false;
		}
		return true;
	}

	int num_downloaded(piece_engine const& e, piece_index_range const r)
	{
		int ret = 0;
		for (piece_index_t i = r.first; i <= r.last; ++i)
		{
			if (is_downloaded(e, i)) ++ret;
		}
		return ret;
	}

	std::vector<bool> downloaded_pieces(piece_engine const& e)
	{
		int const n = e.num_pieces();
		std::vector<bool> ret(std::size_t(std::max(n, 0)), false);
		for (int i = 0; i < n; ++i)
			ret[std::size_t(i)] = is_downloaded(e, piece_index_t(i));
		return ret;
	}
}
