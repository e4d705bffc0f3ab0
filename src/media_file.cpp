/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/media_file.hpp"
#include "piecestream/aux_/string_util.hpp"

#include <algorithm>
#include <iterator>

namespace piecestream {

namespace {

	struct mime_entry
	{
		char const* extension;
		char const* type;
	};

	// sorted by extension
	mime_entry const mime_types[] =
	{
		{ ".avi", "video/x-msvideo" },
		{ ".m4a", "audio/mp4" },
		{ ".m4v", "video/x-m4v" },
		{ ".mkv", "video/x-matroska" },
		{ ".mov", "video/quicktime" },
		{ ".mp3", "audio/mpeg" },
		{ ".mp4", "video/mp4" },
		{ ".ogg", "audio/ogg" },
		{ ".ogv", "video/ogg" },
		{ ".webm", "video/webm" },
	};
}

	std::string file_extension(std::string_view name)
	{
		auto const slash = name.find_last_of("/\\");
		if (slash != std::string_view::npos) name.remove_prefix(slash + 1);
		auto const dot = name.rfind('.');
		if (dot == std::string_view::npos || dot == 0) return {};
		return aux::to_lower(name.substr(dot));
	}

	int media_file_index(std::vector<std::string> const& names
		, std::string_view const extensions)
	{
		std::vector<std::string> exts = aux::parse_comma_separated_string(extensions);
		for (auto& e : exts) e = aux::to_lower(e);

		for (int i = 0; i < int(names.size()); ++i)
		{
			std::string const ext = file_extension(names[std::size_t(i)]);
			if (ext.empty()) continue;
			if (std::find(exts.begin(), exts.end(), ext) != exts.end()) return i;
		}
		return -1;
	}

	std::string mime_type_for(std::string_view const name, std::string_view const fallback)
	{
		std::string const ext = file_extension(name);
		auto const i = std::lower_bound(std::begin(mime_types), std::end(mime_types), ext
			, [](mime_entry const& lhs, std::string const& rhs)
			{ return lhs.extension < rhs; });
		if (i == std::end(mime_types) || ext != i->extension)
			return std::string(fallback);
		return i->type;
	}
}
