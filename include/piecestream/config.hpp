/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_CONFIG_HPP_INCLUDED
#define PIECESTREAM_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>
#include <boost/version.hpp>

#include "piecestream/aux_/export.hpp"

#if defined __GNUC__ || defined __clang__
#define PIECESTREAM_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define PIECESTREAM_FORMAT(fmt, ellipsis)
#endif

#if defined _WIN32 || defined __CYGWIN__
#define PIECESTREAM_WINDOWS 1
#else
#define PIECESTREAM_WINDOWS 0
#endif

#ifndef PIECESTREAM_USE_IOSTREAM
#define PIECESTREAM_USE_IOSTREAM 1
#endif

// debug builds turn on the internal invariant checks
#ifndef PIECESTREAM_USE_ASSERTS
#if defined PIECESTREAM_DEBUG
#define PIECESTREAM_USE_ASSERTS 1
#else
#define PIECESTREAM_USE_ASSERTS 0
#endif
#endif

// the largest HTTP request header we are willing to buffer, unless
// overridden by settings_pack::max_request_header_size
#ifndef PIECESTREAM_MAX_REQUEST_HEADER
#define PIECESTREAM_MAX_REQUEST_HEADER 65536
#endif

namespace piecestream {}
namespace ps = piecestream;

#endif // PIECESTREAM_CONFIG_HPP_INCLUDED
