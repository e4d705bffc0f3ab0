/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/aux_/response_buffer.hpp"
#include "piecestream/error_code.hpp" // for http_status_message

#include <cstdarg>
#include <cstdio>

namespace piecestream { namespace aux {

	void appendf(std::string& target, char const* fmt, ...)
	{
		char buf[1024];
		va_list args;
		va_start(args, fmt);
		int const len = std::vsnprintf(buf, sizeof(buf), fmt, args);
		va_end(args);
		if (len < 0) return;

		if (len < int(sizeof(buf)))
		{
			target.append(buf, std::size_t(len));
			return;
		}

		// it didn't fit in the stack buffer. Format straight into the
		// target
		std::size_t const offset = target.size();
		target.resize(offset + std::size_t(len) + 1);
		va_start(args, fmt);
		std::vsnprintf(&target[offset], std::size_t(len) + 1, fmt, args);
		va_end(args);
		target.resize(offset + std::size_t(len));
	}

	std::string format_response_header(int const status
		, http_header_list const& headers)
	{
		std::string ret;
		appendf(ret, "HTTP/1.1 %d %s\r\n", status, http_status_message(status));
		for (auto const& h : headers)
		{
			ret += h.first;
			ret += ": ";
			ret += h.second;
			ret += "\r\n";
		}
		ret += "\r\n";
		return ret;
	}
}}
