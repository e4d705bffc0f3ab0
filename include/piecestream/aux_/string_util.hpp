/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_STRING_UTIL_HPP_INCLUDED
#define PIECESTREAM_STRING_UTIL_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream { namespace aux {

	PIECESTREAM_EXTRA_EXPORT bool is_digit(char c);
	PIECESTREAM_EXTRA_EXPORT bool is_space(char c);
	PIECESTREAM_EXTRA_EXPORT char to_lower(char c);
	PIECESTREAM_EXTRA_EXPORT std::string to_lower(std::string_view s);

	PIECESTREAM_EXTRA_EXPORT bool string_begins_no_case(std::string_view prefix
		, std::string_view s);
	PIECESTREAM_EXTRA_EXPORT bool string_equal_no_case(std::string_view s1
		, std::string_view s2);

	// strips leading and trailing whitespace
	PIECESTREAM_EXTRA_EXPORT std::string_view trim(std::string_view s);

	// splits the string at the first occurrence of sep. The second element is
	// empty if sep was not found.
	PIECESTREAM_EXTRA_EXPORT std::pair<std::string_view, std::string_view>
		split_string(std::string_view last, char sep);

	// splits a comma separated list, trimming each item and skipping empty
	// ones
	PIECESTREAM_EXTRA_EXPORT std::vector<std::string> parse_comma_separated_string(
		std::string_view in);

	// decodes %-escapes and '+' in a URL component
	PIECESTREAM_EXTRA_EXPORT std::string unescape_string(std::string_view s
		, error_code& ec);

	// escapes a string for inclusion in a JSON string literal (without the
	// surrounding quotes)
	PIECESTREAM_EXTRA_EXPORT std::string escape_json(std::string_view s);

	// formats a byte count as "1.50 MB", "12.00 KB" or "512 B"
	PIECESTREAM_EXTRA_EXPORT std::string human_readable_bytes(std::int64_t bytes);
}}

#endif // PIECESTREAM_STRING_UTIL_HPP_INCLUDED
