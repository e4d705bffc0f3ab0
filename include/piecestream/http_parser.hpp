/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_HTTP_PARSER_HPP_INCLUDED
#define PIECESTREAM_HTTP_PARSER_HPP_INCLUDED

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <boost/asio/buffer.hpp>

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream {

	// incremental parser for HTTP requests. Feed it the receive buffer every
	// time more bytes arrive. The buffer must always start at the first byte
	// of the request.
	class PIECESTREAM_EXPORT http_request_parser
	{
	public:
		explicit http_request_parser(int max_header_size = PIECESTREAM_MAX_REQUEST_HEADER);

		// returns the number of bytes of ``recv_buffer`` consumed by this
		// call. Once finished() returns true, the bytes past
		// body_start() + content_length() belong to the next request.
		int incoming(boost::asio::const_buffer recv_buffer, error_code& ec);

		// the value of the header (the name is lower case), or the empty
		// string
		std::string const& header(std::string_view key) const;
		bool has_header(std::string_view key) const;

		// the method, lower-cased
		std::string const& method() const { return m_method; }

		// the request target, as sent
		std::string const& path() const { return m_path; }
		std::string const& protocol() const { return m_protocol; }

		bool header_finished() const { return m_state == read_body || m_finished; }
		bool finished() const { return m_finished; }
		int body_start() const { return m_body_start_pos; }
		std::int64_t content_length() const { return m_content_length; }

		// the number of bytes this request occupies in the receive buffer,
		// header and body. Only valid once finished
		int request_size() const
		{ return m_body_start_pos + int(m_content_length); }

		// whether the client allows the connection to be reused after this
		// request. HTTP/1.1 keeps connections open unless the client sends
		// ``Connection: close``, HTTP/1.0 only with ``Connection: keep-alive``
		bool keep_alive() const;

		std::map<std::string, std::string, std::less<>> const& headers() const
		{ return m_header; }

		void reset();

	private:
		int m_max_header_size;
		int m_recv_pos = 0;
		std::string m_method;
		std::string m_path;
		std::string m_protocol;

		std::int64_t m_content_length = 0;

		enum { read_request_line, read_header, read_body, error_state } m_state
			= read_request_line;

		std::map<std::string, std::string, std::less<>> m_header;
		int m_body_start_pos = 0;

		bool m_finished = false;
	};

	// the path and the query string of a request target
	struct PIECESTREAM_EXPORT request_target
	{
		std::string path;
		std::string query;
	};

	// splits a request target at the '?'. The path is unescaped, the query
	// is left as is. Fails with invalid_escaped_string on bad escapes.
	PIECESTREAM_EXPORT request_target parse_request_target(std::string_view target
		, error_code& ec);

	// the value of the ``key`` parameter of a query string, unescaped. Empty
	// if the parameter is not present
	PIECESTREAM_EXPORT std::string query_value(std::string_view query
		, std::string_view key, error_code& ec);

	// the transfer id of a request like ``/stream?<id>`` or
	// ``/stream?id=<id>``. Empty if there is none
	PIECESTREAM_EXPORT std::string transfer_id_from_query(std::string_view query
		, error_code& ec);
}

#endif // PIECESTREAM_HTTP_PARSER_HPP_INCLUDED
