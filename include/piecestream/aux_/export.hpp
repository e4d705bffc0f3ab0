/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_EXPORT_HPP_INCLUDED
#define PIECESTREAM_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// PIECESTREAM_BUILDING_SHARED is defined when building the shared library,
// PIECESTREAM_LINKING_SHARED when linking against it.
#if defined PIECESTREAM_BUILDING_SHARED
# define PIECESTREAM_EXPORT BOOST_SYMBOL_EXPORT
#elif defined PIECESTREAM_LINKING_SHARED
# define PIECESTREAM_EXPORT BOOST_SYMBOL_IMPORT
#endif

// symbols that are only exported so the unit tests can reach them
#if defined PIECESTREAM_EXPORT_EXTRA
# define PIECESTREAM_EXTRA_EXPORT PIECESTREAM_EXPORT
#endif

#ifndef PIECESTREAM_EXPORT
# define PIECESTREAM_EXPORT
#endif

#ifndef PIECESTREAM_EXTRA_EXPORT
# define PIECESTREAM_EXTRA_EXPORT
#endif

#endif // PIECESTREAM_EXPORT_HPP_INCLUDED
