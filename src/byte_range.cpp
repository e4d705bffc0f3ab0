/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/byte_range.hpp"
#include "piecestream/assert.hpp"
#include "piecestream/aux_/string_util.hpp"

#include <algorithm>
#include <limits>

#if PIECESTREAM_USE_IOSTREAM
#include <ostream>
#endif

namespace piecestream {

	byte_range::byte_range(std::int64_t const s, std::int64_t const e)
		: start(s), end(e)
	{
		PIECESTREAM_ASSERT(s >= 0);
		PIECESTREAM_ASSERT(s <= e);
	}

	bool byte_range::valid_for(std::int64_t const content_length) const
	{
		return start >= 0
			&& start <= end
			&& start < content_length
			&& end < content_length;
	}

	std::string byte_range::content_range(std::int64_t const content_length) const
	{
		std::string ret = "bytes ";
		ret += std::to_string(start);
		ret += '-';
		ret += std::to_string(end);
		ret += '/';
		ret += std::to_string(content_length);
		return ret;
	}

#if PIECESTREAM_USE_IOSTREAM
	std::ostream& operator<<(std::ostream& os, byte_range const& r)
	{
		return os << "[" << r.start << ", " << r.end << "]";
	}
#endif

	std::string unsatisfied_content_range(std::int64_t const content_length)
	{
		return "bytes */" + std::to_string(content_length);
	}

	namespace {

	// parses an unsigned decimal number. Returns false on any non-digit
	// character, an empty string or overflow.
	bool parse_number(std::string_view str, std::int64_t& out)
	{
		if (str.empty()) return false;
		std::int64_t val = 0;
		for (char const c : str)
		{
			if (!aux::is_digit(c)) return false;
			int const digit = c - '0';
			if (val > (std::numeric_limits<std::int64_t>::max() - digit) / 10)
				return false;
			val = val * 10 + digit;
		}
		out = val;
		return true;
	}

	} // anonymous namespace

	parsed_range parse_range_header(std::string_view value, error_code& ec)
	{
		parsed_range ret;
		value = aux::trim(value);

		std::string_view const unit = "bytes=";
		if (!aux::string_begins_no_case(unit, value))
		{
			ec = errors::invalid_range_format;
			return ret;
		}
		value.remove_prefix(unit.size());
		value = aux::trim(value);

		if (value.empty())
		{
			ec = errors::invalid_range_format;
			return ret;
		}

		if (value.find(',') != std::string_view::npos)
		{
			ec = errors::multiple_ranges;
			return ret;
		}

		// "--N" is a suffix with a negative length
		if (value.size() > 1 && value[0] == '-' && value[1] == '-')
		{
			std::int64_t ignore;
			ec = parse_number(aux::trim(value.substr(2)), ignore)
				? errors::negative_range_value
				: errors::invalid_range_number;
			return ret;
		}

		auto const dash = value.find('-');
		if (dash == std::string_view::npos
			|| value.find('-', dash + 1) != std::string_view::npos)
		{
			ec = errors::invalid_range_format;
			return ret;
		}

		std::string_view const first = aux::trim(value.substr(0, dash));
		std::string_view const second = aux::trim(value.substr(dash + 1));

		if (first.empty() && second.empty())
		{
			ec = errors::invalid_range_format;
			return ret;
		}

		if (first.empty())
		{
			if (!parse_number(second, ret.suffix_length))
			{
				ec = errors::invalid_range_number;
				return ret;
			}
			ret.kind = parsed_range::suffix;
			return ret;
		}

		if (!parse_number(first, ret.start))
		{
			ec = errors::invalid_range_number;
			return ret;
		}

		if (second.empty())
		{
			ret.kind = parsed_range::start_only;
			return ret;
		}

		if (!parse_number(second, ret.end))
		{
			ec = errors::invalid_range_number;
			return ret;
		}
		ret.kind = parsed_range::start_end;
		return ret;
	}

	byte_range apply_chunk_limit(byte_range r
		, std::int64_t const max_chunk, std::int64_t const content_length)
	{
		PIECESTREAM_ASSERT(content_length > 0);
		r.end = std::min(r.end, content_length - 1);
		// written this way to not overflow when start is close to the
		// maximum value
		if (max_chunk > 0 && r.end - r.start >= max_chunk)
			r.end = r.start + max_chunk - 1;
		return r;
	}

	byte_range normalize_range(parsed_range const& r
		, std::int64_t const content_length, std::int64_t const max_chunk
		, error_code& ec)
	{
		if (content_length <= 0)
		{
			ec = errors::empty_content;
			return {};
		}

		std::int64_t const last = content_length - 1;
		byte_range ret;

		switch (r.kind)
		{
			case parsed_range::suffix:
				ret.start = std::max(content_length - r.suffix_length, std::int64_t(0));
				ret.end = last;
				break;
			case parsed_range::start_only:
				ret.start = std::clamp(r.start, std::int64_t(0), last);
				ret.end = last;
				break;
			case parsed_range::start_end:
				ret.start = std::clamp(r.start, std::int64_t(0), last);
				ret.end = std::clamp(r.end, std::int64_t(0), last);
				if (ret.end < ret.start)
				{
					ec = errors::range_not_satisfiable;
					return {};
				}
				break;
		}

		// a zero length suffix leaves start one past the end
		if (!ret.valid_for(content_length))
		{
			ec = errors::range_not_satisfiable;
			return {};
		}

		return apply_chunk_limit(ret, max_chunk, content_length);
	}

	byte_range initial_chunk(std::int64_t const content_length
		, std::int64_t const chunk)
	{
		PIECESTREAM_ASSERT_PRECOND(content_length > 0);
		return apply_chunk_limit(byte_range(0, content_length - 1), chunk
			, content_length);
	}

	byte_range resolve_range(std::string_view const header
		, std::int64_t const content_length, std::int64_t const max_chunk
		, std::int64_t const initial_chunk_size, error_code& ec)
	{
		if (content_length <= 0)
		{
			ec = errors::empty_content;
			return {};
		}

		if (aux::trim(header).empty())
			return initial_chunk(content_length, initial_chunk_size);

		parsed_range const p = parse_range_header(header, ec);
		if (ec) return {};
		return normalize_range(p, content_length, max_chunk, ec);
	}
}
