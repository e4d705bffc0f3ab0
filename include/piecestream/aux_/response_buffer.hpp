/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_RESPONSE_BUFFER_HPP_INCLUDED
#define PIECESTREAM_RESPONSE_BUFFER_HPP_INCLUDED

#include <string>
#include <utility>
#include <vector>

#include "piecestream/config.hpp"

namespace piecestream { namespace aux {

	// appends printf-style formatted text to ``target``
	PIECESTREAM_EXTRA_EXPORT void appendf(std::string& target, char const* fmt, ...)
		PIECESTREAM_FORMAT(2, 3);

	using http_header_list = std::vector<std::pair<std::string, std::string>>;

	// the status line and header of an HTTP/1.1 response, including the
	// blank line that ends it
	PIECESTREAM_EXTRA_EXPORT std::string format_response_header(int status
		, http_header_list const& headers);
}}

#endif // PIECESTREAM_RESPONSE_BUFFER_HPP_INCLUDED
