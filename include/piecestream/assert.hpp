/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ASSERT_HPP_INCLUDED
#define PIECESTREAM_ASSERT_HPP_INCLUDED

#include "piecestream/config.hpp"

namespace piecestream {

// internal
PIECESTREAM_EXPORT void assert_print(char const* fmt, ...) PIECESTREAM_FORMAT(1,2);

// internal
PIECESTREAM_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* val, int kind = 0);

}

#if PIECESTREAM_USE_ASSERTS

#if PIECESTREAM_USE_IOSTREAM
#include <sstream>
#endif

#define PIECESTREAM_ASSERT_PRECOND(x) \
	do { if (x) {} else piecestream::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } while (false)

#define PIECESTREAM_ASSERT(x) \
	do { if (x) {} else piecestream::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } while (false)

#if PIECESTREAM_USE_IOSTREAM
#define PIECESTREAM_ASSERT_VAL(x, y) \
	do { if (x) {} else { std::stringstream __s__; __s__ << #y ": " << y; \
	piecestream::assert_fail(#x, __LINE__, __FILE__, __func__, __s__.str().c_str(), 0); } } while (false)
#else
#define PIECESTREAM_ASSERT_VAL(x, y) PIECESTREAM_ASSERT(x)
#endif

#define PIECESTREAM_ASSERT_FAIL() \
	piecestream::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, nullptr, 0)

#else // PIECESTREAM_USE_ASSERTS

#define PIECESTREAM_ASSERT_PRECOND(a) do {} while (false)
#define PIECESTREAM_ASSERT(a) do {} while (false)
#define PIECESTREAM_ASSERT_VAL(a, b) do {} while (false)
#define PIECESTREAM_ASSERT_FAIL() do {} while (false)

#endif // PIECESTREAM_USE_ASSERTS

#endif // PIECESTREAM_ASSERT_HPP_INCLUDED
