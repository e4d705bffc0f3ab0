/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_MEDIA_FILE_HPP_INCLUDED
#define PIECESTREAM_MEDIA_FILE_HPP_INCLUDED

#include <string>
#include <string_view>
#include <vector>

#include "piecestream/config.hpp"

namespace piecestream {

	// the lower-cased extension of ``name``, including the dot. Empty if the
	// last path element has no dot
	PIECESTREAM_EXPORT std::string file_extension(std::string_view name);

	// the index of the first file whose extension is one of
	// ``extensions``, compared case-insensitively. ``extensions`` is a
	// comma separated list like the media_extensions setting. -1 if there
	// is none.
	PIECESTREAM_EXPORT int media_file_index(std::vector<std::string> const& names
		, std::string_view extensions);

	// the Content-Type for a file name, or ``fallback`` if its extension is
	// not a known media type
	PIECESTREAM_EXPORT std::string mime_type_for(std::string_view name
		, std::string_view fallback);
}

#endif // PIECESTREAM_MEDIA_FILE_HPP_INCLUDED
