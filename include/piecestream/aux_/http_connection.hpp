/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_HTTP_CONNECTION_HPP_INCLUDED
#define PIECESTREAM_HTTP_CONNECTION_HPP_INCLUDED

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "piecestream/config.hpp"
#include "piecestream/http_parser.hpp"
#include "piecestream/time.hpp"
#include "piecestream/aux_/response_buffer.hpp"
#include "piecestream/aux_/stream_responder.hpp"

namespace piecestream {

	class transfer;

namespace aux {

	class session_impl;

	// one accepted client connection. It reads requests one at a time and
	// hands them to the session. While a response is in flight the socket
	// keeps being read, so the response can be aborted as soon as the
	// client goes away.
	class http_connection : public std::enable_shared_from_this<http_connection>
	{
	public:
		http_connection(std::shared_ptr<session_impl> ses
			, boost::asio::ip::tcp::socket s
			, int max_header_size
			, time_duration idle_timeout);

		http_connection(http_connection const&) = delete;
		http_connection& operator=(http_connection const&) = delete;

		void start();

		// closes the socket and aborts the response in flight, if any.
		// Calling it more than once has no effect
		void close();

		bool is_closed() const { return m_closed; }

		// true if the response in flight streams ``t``
		bool is_streaming(transfer const* t) const
		{ return m_responder && m_responder->get_transfer() == t; }
		boost::asio::ip::tcp::endpoint const& remote() const { return m_remote; }

		// answers the current request with a complete response
		void send_response(int status, http_header_list headers
			, std::string body, bool keep_alive);

		// answers the current request with a stream of a transfer
		void send_stream(std::shared_ptr<transfer> t, stream_request req
			, stream_settings s);

	private:

		void read_more();
		void on_read(error_code const& ec, std::size_t bytes);
		void parse_request();
		void on_response_done(bool keep_alive);
		void arm_idle_timer();
		void on_idle_timeout(error_code const& ec);

		std::shared_ptr<session_impl> m_ses;
		std::shared_ptr<boost::asio::ip::tcp::socket> m_socket;
		boost::asio::ip::tcp::endpoint m_remote;

		// [m_recv_start, m_recv_end) holds bytes not yet consumed by an
		// answered request. The buffer is only compacted while no read is
		// outstanding, since the pending read writes at m_recv_end
		std::vector<char> m_recv_buffer;
		int m_recv_start = 0;
		int m_recv_end = 0;
		http_request_parser m_parser;

		boost::asio::steady_timer m_idle_timer;
		time_duration const m_idle_timeout;

		std::shared_ptr<stream_responder> m_responder;
		std::string m_send_buffer;

		bool m_reading = false;
		bool m_responding = false;
		bool m_closed = false;
	};
}}

#endif // PIECESTREAM_HTTP_CONNECTION_HPP_INCLUDED
