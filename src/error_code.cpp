/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"

#include <string>

namespace piecestream {

	struct piecestream_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* piecestream_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "piecestream";
	}

	std::string piecestream_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"invalid range format",
			"multiple ranges are not supported",
			"invalid number in range",
			"range value cannot be negative",
			"range not satisfiable",
			"content is empty",

			"metadata not ready",
			"invalid piece index",

			"piece not found",
			"piece evicted from memory",
			"piece cache is closed",
			"chunk larger than the memory budget",

			"timed out waiting for pieces",
			"transfer not found",
			"missing transfer id",
			"duplicate transfer id",

			"failed to parse HTTP request",
			"HTTP request header too large",
			"unsupported HTTP method",
			"invalid escaped string",
		};
		static_assert(sizeof(msgs) / sizeof(msgs[0]) == errors::error_code_max
			, "message table out of sync with error_code_enum");
		if (ev < 0 || ev >= int(sizeof(msgs) / sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	char const* http_status_message(int const status)
	{
		switch (status)
		{
			case errors::ok: return "OK";
			case errors::no_content: return "No Content";
			case errors::partial_content: return "Partial Content";
			case errors::bad_request: return "Bad Request";
			case errors::not_found: return "Not Found";
			case errors::method_not_allowed: return "Method Not Allowed";
			case errors::range_not_satisfiable_status: return "Range Not Satisfiable";
			case errors::internal_server_error: return "Internal Server Error";
			case errors::service_unavailable: return "Service Unavailable";
		}
		return "Unknown";
	}

	struct http_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "http"; }
		std::string message(int ev) const override
		{
			std::string ret;
			ret += std::to_string(ev);
			ret += " ";
			ret += http_status_message(ev);
			return ret;
		}
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	boost::system::error_category& piecestream_category()
	{
		static piecestream_error_category piecestream_category;
		return piecestream_category;
	}

	boost::system::error_category& http_category()
	{
		static http_error_category http_category;
		return http_category;
	}

	void throw_error(error_code const& ec)
	{
		throw system_error(ec);
	}

	namespace errors {

		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, piecestream_category()};
		}

		boost::system::error_code make_error_code(http_errors e)
		{
			return {e, http_category()};
		}
	}
}
