/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ERROR_CODE_HPP_INCLUDED
#define PIECESTREAM_ERROR_CODE_HPP_INCLUDED

#include "piecestream/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>

namespace piecestream {

	namespace errors {

		// piecestream uses boost.system's ``error_code`` class to represent
		// errors. piecestream has its own error category
		// piecestream_category() with the error codes defined by
		// error_code_enum.
		enum error_code_enum
		{
			// Not an error
			no_error = 0,

			// The Range header is not of the form ``bytes=<a>-<b>``
			invalid_range_format,
			// The Range header lists more than one range
			multiple_ranges,
			// A component of the Range header is not a decimal number
			invalid_range_number,
			// A suffix length in the Range header is negative
			negative_range_value,
			// The range does not overlap the content
			range_not_satisfiable,
			// The content has zero length, no range can be served from it
			empty_content,

			// The piece engine does not know the piece length or content
			// length yet
			metadata_not_ready,
			// A piece index outside of the content was used
			invalid_piece_index,

			// The piece has never been put into the cache, or its owner
			// closed it
			piece_not_found,
			// The piece was discarded to stay within the memory budget.
			// The engine is expected to fetch it again
			piece_evicted,
			// The cache has been closed
			cache_closed,
			// A single chunk is larger than the whole memory budget
			chunk_too_large,

			// The required pieces were not downloaded before the deadline
			readiness_timeout,
			// No transfer is registered under the requested id
			transfer_not_found,
			// The request does not name a transfer
			missing_transfer_id,
			// A transfer with this id is already registered
			duplicate_transfer,

			// The HTTP request could not be parsed
			http_parse_error,
			// The HTTP request header exceeds the configured limit
			http_header_too_large,
			// The HTTP method is not supported on this resource
			unsupported_method,
			// A %-escape in the request target is malformed
			invalid_escaped_string,

			// the number of error codes
			error_code_max
		};

		// HTTP status codes sent by the stream server. They are reported
		// in the http_category()
		enum http_errors
		{
			ok = 200,
			no_content = 204,
			partial_content = 206,
			bad_request = 400,
			not_found = 404,
			method_not_allowed = 405,
			range_not_satisfiable_status = 416,
			internal_server_error = 500,
			service_unavailable = 503
		};

		// hidden
		PIECESTREAM_EXPORT boost::system::error_code make_error_code(error_code_enum e);

		// hidden
		PIECESTREAM_EXPORT boost::system::error_code make_error_code(http_errors e);

	} // namespace errors

	// return the instance of the piecestream_error_category which
	// maps piecestream error codes to human readable error messages.
	PIECESTREAM_EXPORT boost::system::error_category& piecestream_category();

	// returns the error_category for HTTP errors
	PIECESTREAM_EXPORT boost::system::error_category& http_category();

	// the reason phrase for an HTTP status code, "Unknown" for codes the
	// server never emits
	PIECESTREAM_EXPORT char const* http_status_message(int status);

	using boost::system::error_code;
	using boost::system::error_condition;
	using system_error = boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;

	namespace errc = boost::system::errc;

	// internal
	[[noreturn]] PIECESTREAM_EXPORT void throw_error(error_code const& ec);
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<piecestream::errors::error_code_enum>
	{ static const bool value = true; };

	template<> struct is_error_code_enum<piecestream::errors::http_errors>
	{ static const bool value = true; };
} }

#endif // PIECESTREAM_ERROR_CODE_HPP_INCLUDED
