/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_TIME_HPP_INCLUDED
#define PIECESTREAM_TIME_HPP_INCLUDED

#include <chrono>
#include <cstdint>

#include "piecestream/config.hpp"

namespace piecestream {

	using clock_type = std::chrono::steady_clock;
	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	using seconds = std::chrono::seconds;
	using milliseconds = std::chrono::milliseconds;

	inline time_point time_now() { return clock_type::now(); }

	template <class D>
	std::int64_t total_milliseconds(D const d)
	{ return std::chrono::duration_cast<milliseconds>(d).count(); }

}

#endif // PIECESTREAM_TIME_HPP_INCLUDED
