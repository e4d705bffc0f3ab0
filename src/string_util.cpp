/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/aux_/string_util.hpp"

#include <cstdio>
#include <cstdint>
#include <tuple>

namespace piecestream { namespace aux {

	bool is_digit(char const c)
	{
		return c >= '0' && c <= '9';
	}

	bool is_space(char const c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\r'
			|| c == '\f' || c == '\v';
	}

	char to_lower(char const c)
	{
		return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
	}

	std::string to_lower(std::string_view const s)
	{
		std::string ret(s);
		for (char& c : ret) c = to_lower(c);
		return ret;
	}

	bool string_begins_no_case(std::string_view const prefix, std::string_view const s)
	{
		if (s.size() < prefix.size()) return false;
		return string_equal_no_case(prefix, s.substr(0, prefix.size()));
	}

	bool string_equal_no_case(std::string_view const s1, std::string_view const s2)
	{
		if (s1.size() != s2.size()) return false;
		for (std::size_t i = 0; i < s1.size(); ++i)
		{
			if (to_lower(s1[i]) != to_lower(s2[i])) return false;
		}
		return true;
	}

	std::string_view trim(std::string_view s)
	{
		while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
		while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
		return s;
	}

	std::pair<std::string_view, std::string_view> split_string(
		std::string_view const last, char const sep)
	{
		auto const pos = last.find(sep);
		if (pos == std::string_view::npos) return {last, {}};
		return {last.substr(0, pos), last.substr(pos + 1)};
	}

	std::vector<std::string> parse_comma_separated_string(std::string_view in)
	{
		std::vector<std::string> ret;
		while (!in.empty())
		{
			std::string_view item;
			std::tie(item, in) = split_string(in, ',');
			item = trim(item);
			if (!item.empty()) ret.emplace_back(item);
		}
		return ret;
	}

	namespace {

	int hex_to_int(char const c)
	{
		if (c >= '0' && c <= '9') return c - '0';
		if (c >= 'A' && c <= 'F') return c - 'A' + 10;
		if (c >= 'a' && c <= 'f') return c - 'a' + 10;
		return -1;
	}

	}

	std::string unescape_string(std::string_view const s, error_code& ec)
	{
		std::string ret;
		for (auto i = s.begin(); i != s.end(); ++i)
		{
			if (*i == '+')
			{
				ret += ' ';
				continue;
			}
			if (*i != '%')
			{
				ret += *i;
				continue;
			}

			++i;
			int const high = (i == s.end()) ? -1 : hex_to_int(*i);
			if (high < 0)
			{
				ec = errors::invalid_escaped_string;
				return ret;
			}
			++i;
			int const low = (i == s.end()) ? -1 : hex_to_int(*i);
			if (low < 0)
			{
				ec = errors::invalid_escaped_string;
				return ret;
			}
			ret += char(high * 16 + low);
		}
		return ret;
	}

	std::string escape_json(std::string_view const s)
	{
		std::string ret;
		ret.reserve(s.size());
		for (char const c : s)
		{
			switch (c)
			{
				case '"': ret += "\\\""; break;
				case '\\': ret += "\\\\"; break;
				case '\n': ret += "\\n"; break;
				case '\r': ret += "\\r"; break;
				case '\t': ret += "\\t"; break;
				default:
					if (static_cast<unsigned char>(c) < 0x20)
					{
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
						ret += buf;
					}
					else
					{
						ret += c;
					}
			}
		}
		return ret;
	}

	std::string human_readable_bytes(std::int64_t const bytes)
	{
		std::int64_t const kB = 1024;
		std::int64_t const MB = 1024 * 1024;
		char buf[64];
		if (bytes >= MB)
			std::snprintf(buf, sizeof(buf), "%.2f MB", double(bytes) / double(MB));
		else if (bytes >= kB)
			std::snprintf(buf, sizeof(buf), "%.2f KB", double(bytes) / double(kB));
		else
			std::snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(bytes));
		return buf;
	}
}}
