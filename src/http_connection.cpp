/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/aux_/http_connection.hpp"
#include "piecestream/aux_/session_impl.hpp"
#include "piecestream/alert_types.hpp"

#include <algorithm>
#include <cstring>

#include <boost/asio/write.hpp>

namespace piecestream { namespace aux {

	http_connection::http_connection(std::shared_ptr<session_impl> ses
		, boost::asio::ip::tcp::socket s
		, int const max_header_size
		, time_duration const idle_timeout)
		: m_ses(std::move(ses))
		, m_socket(std::make_shared<boost::asio::ip::tcp::socket>(std::move(s)))
		, m_recv_buffer(std::size_t(max_header_size) + 1024)
		, m_parser(max_header_size)
		, m_idle_timer(m_socket->get_executor())
		, m_idle_timeout(idle_timeout)
	{
		error_code ec;
		m_remote = m_socket->remote_endpoint(ec);
	}

	void http_connection::start()
	{
		arm_idle_timer();
		read_more();
	}

	void http_connection::read_more()
	{
		if (m_reading || m_closed) return;

		if (m_recv_start > 0)
		{
			std::memmove(m_recv_buffer.data(), m_recv_buffer.data() + m_recv_start
				, std::size_t(m_recv_end - m_recv_start));
			m_recv_end -= m_recv_start;
			m_recv_start = 0;
		}

		// while a response is in flight, a full buffer means the client is
		// pipelining more than we can hold. Stop reading until the response
		// is done
		if (m_recv_end == int(m_recv_buffer.size())) return;

		m_reading = true;
		m_socket->async_read_some(boost::asio::buffer(m_recv_buffer.data() + m_recv_end
			, m_recv_buffer.size() - std::size_t(m_recv_end))
			, [self = shared_from_this()](error_code const& ec, std::size_t const bytes)
			{ self->on_read(ec, bytes); });
	}

	void http_connection::on_read(error_code const& ec, std::size_t const bytes)
	{
		m_reading = false;
		if (m_closed) return;

		// the client closed its end or the connection failed. Either way
		// there's nobody to send the response to
		if (ec)
		{
			close();
			return;
		}

		m_recv_end += int(bytes);
		if (!m_responding) parse_request();
		read_more();
	}

	void http_connection::parse_request()
	{
		if (m_recv_end == m_recv_start || m_closed) return;

		error_code ec;
		m_parser.incoming(boost::asio::buffer(m_recv_buffer.data() + m_recv_start
			, std::size_t(m_recv_end - m_recv_start)), ec);
		if (ec)
		{
			alert_manager& alerts = m_ses->alerts();
			if (alerts.should_post<request_error_alert>())
			{
				alerts.emplace_alert<request_error_alert>(m_remote, int(errors::bad_request)
					, m_parser.path(), ec);
			}
			m_responding = true;
			m_idle_timer.cancel();
			send_response(errors::bad_request, {}, {}, false);
			return;
		}

		if (!m_parser.finished()) return;

		m_idle_timer.cancel();
		m_responding = true;

		alert_manager& alerts = m_ses->alerts();
		if (alerts.should_post<incoming_request_alert>())
		{
			alerts.emplace_alert<incoming_request_alert>(m_remote
				, m_parser.method(), m_parser.path(), m_parser.header("range"));
		}

		m_ses->handle_request(shared_from_this(), m_parser);
	}

	void http_connection::send_response(int const status, http_header_list headers
		, std::string body, bool const keep_alive)
	{
		if (m_closed) return;

		headers.emplace_back("Content-Length", std::to_string(body.size()));
		if (!keep_alive) headers.emplace_back("Connection", "close");
		m_send_buffer = format_response_header(status, headers);
		if (m_parser.method() != "head") m_send_buffer += body;

		boost::asio::async_write(*m_socket, boost::asio::buffer(m_send_buffer)
			, [self = shared_from_this(), keep_alive](error_code const& ec, std::size_t)
			{ self->on_response_done(keep_alive && !ec); });
	}

	void http_connection::send_stream(std::shared_ptr<transfer> t, stream_request req
		, stream_settings s)
	{
		if (m_closed) return;

		std::weak_ptr<http_connection> self = shared_from_this();
		m_responder = std::make_shared<stream_responder>(m_socket, std::move(t)
			, std::move(req), std::move(s), m_ses->alerts()
			, [self](bool const keep_alive)
			{
				if (auto c = self.lock()) c->on_response_done(keep_alive);
			});
		m_responder->start();
	}

	void http_connection::on_response_done(bool const keep_alive)
	{
		m_responder.reset();
		m_responding = false;
		if (m_closed) return;

		if (!keep_alive)
		{
			close();
			return;
		}

		// skip the request we just answered. Bytes past it belong to the
		// next request. read_more() compacts once no read is pending
		int const pending = m_recv_end - m_recv_start;
		int const consumed = m_parser.finished()
			? std::min(m_parser.request_size(), pending) : pending;
		m_recv_start += consumed;
		m_parser.reset();

		arm_idle_timer();
		parse_request();
		read_more();
	}

	void http_connection::arm_idle_timer()
	{
		if (m_idle_timeout <= time_duration::zero()) return;
		m_idle_timer.expires_after(m_idle_timeout);
		m_idle_timer.async_wait([self = shared_from_this()](error_code const& ec)
			{ self->on_idle_timeout(ec); });
	}

	void http_connection::on_idle_timeout(error_code const& ec)
	{
		if (ec == boost::asio::error::operation_aborted) return;
		if (m_closed || m_responding) return;
		close();
	}

	void http_connection::close()
	{
		if (m_closed) return;
		m_closed = true;

		if (m_responder)
		{
			m_responder->abort();
			m_responder.reset();
		}
		m_responding = false;

		m_idle_timer.cancel();
		error_code ec;
		m_socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
		m_socket->close(ec);

		m_ses->remove_connection(this);
	}
}}
