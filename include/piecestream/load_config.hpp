/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_LOAD_CONFIG_HPP_INCLUDED
#define PIECESTREAM_LOAD_CONFIG_HPP_INCLUDED

#include <string>

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"
#include "piecestream/settings_pack.hpp"

namespace piecestream {

	// loads settings from a simple text file, where each line is a key value
	// pair. The keys are the names of the settings_pack settings. Blank lines
	// and lines starting with ``#`` are ignored, as are unknown keys. Bool
	// values are given as 0 or 1.
	PIECESTREAM_EXPORT settings_pack load_config(std::string const& config_file
		, error_code& ec);

	// the inverse of load_config(). Only settings that differ from their
	// default values are written.
	PIECESTREAM_EXPORT std::string save_config(settings_pack const& p);

	// writes save_config() of ``p`` to ``config_file``
	PIECESTREAM_EXPORT void save_config(settings_pack const& p
		, std::string const& config_file, error_code& ec);
}

#endif
