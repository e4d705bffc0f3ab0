/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/aux_/stream_responder.hpp"
#include "piecestream/aux_/response_buffer.hpp"
#include "piecestream/transfer.hpp"
#include "piecestream/alert_manager.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/assert.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace piecestream { namespace aux {

	stream_responder::stream_responder(std::shared_ptr<boost::asio::ip::tcp::socket> sock
		, std::shared_ptr<transfer> t
		, stream_request req
		, stream_settings s
		, alert_manager& alerts
		, done_handler h)
		: m_socket(std::move(sock))
		, m_transfer(std::move(t))
		, m_request(std::move(req))
		, m_settings(std::move(s))
		, m_alerts(alerts)
		, m_done(std::move(h))
		, m_timer(m_socket->get_executor())
	{}

	stream_responder::~stream_responder() = default;

	void stream_responder::start()
	{
		m_transfer->stream_started();
		m_content_length = m_transfer->engine().content_length();
		if (m_content_length <= 0)
		{
			wait_for_metadata();
			return;
		}
		start_response();
	}

	void stream_responder::wait_for_metadata()
	{
		std::weak_ptr<stream_responder> self = shared_from_this();
		auto ex = m_socket->get_executor();
		m_subscription = m_transfer->engine().subscribe([self, ex]
		{
			boost::asio::post(ex, [self]
			{
				if (auto r = self.lock()) r->on_metadata();
			});
		});
		m_subscribed = true;

		// the metadata may have arrived before we subscribed
		if (m_transfer->engine().content_length() > 0)
		{
			on_metadata();
			return;
		}

		m_timer.expires_after(m_settings.metadata_timeout);
		m_timer.async_wait([s = shared_from_this()](error_code const& ec)
			{ s->on_metadata_timeout(ec); });
	}

	void stream_responder::on_metadata()
	{
		if (m_closed || m_state != state_t::waiting_metadata) return;
		std::int64_t const len = m_transfer->engine().content_length();
		if (len <= 0) return;

		m_timer.cancel();
		if (m_subscribed)
		{
			m_transfer->engine().unsubscribe(m_subscription);
			m_subscribed = false;
		}
		m_content_length = len;
		start_response();
	}

	void stream_responder::on_metadata_timeout(error_code const& ec)
	{
		if (ec == boost::asio::error::operation_aborted) return;
		if (m_closed || m_state != state_t::waiting_metadata) return;

		if (m_transfer->engine().content_length() > 0)
		{
			on_metadata();
			return;
		}

		error_code const e = errors::metadata_not_ready;
		if (m_alerts.should_post<stream_error_alert>())
			m_alerts.emplace_alert<stream_error_alert>(m_transfer->id(), e, 0, false);
		send_error(errors::service_unavailable);
	}

	void stream_responder::start_response()
	{
		error_code ec;
		m_range = resolve_range(m_request.range, m_content_length
			, m_settings.max_chunk_size, m_settings.initial_chunk_size, ec);
		if (ec)
		{
			if (m_alerts.should_post<range_rejected_alert>())
			{
				m_alerts.emplace_alert<range_rejected_alert>(m_transfer->id()
					, m_request.range, m_content_length, ec);
			}
			send_error(errors::range_not_satisfiable_status);
			return;
		}

		m_state = state_t::waiting_pieces;

		// if the piece length is not known yet there is nothing to
		// prioritize. The wait below completes right away in that case
		error_code pec;
		m_transfer->scheduler().prioritize(m_range, m_settings.read_ahead_bytes, pec);

		m_wait = m_transfer->scheduler().async_wait_ready(m_range
			, m_settings.piece_wait_timeout
			, [s = shared_from_this()](error_code const& e) { s->on_pieces_ready(e); });
	}

	void stream_responder::on_pieces_ready(error_code const& ec)
	{
		if (m_closed) return;
		m_wait.reset();

		// anything but cancellation falls through to streaming. A
		// readiness_timeout (already reported by the scheduler) serves the
		// range anyway and lets the reader wait for the pieces.
		// metadata_not_ready means the piece length is unknown, so nothing
		// was prioritized and the reader is left to wait the same way
		if (ec == boost::asio::error::operation_aborted) return;

		error_code rec;
		m_reader = m_transfer->engine().create_reader(m_range, rec);
		if (rec)
		{
			if (m_alerts.should_post<stream_error_alert>())
				m_alerts.emplace_alert<stream_error_alert>(m_transfer->id(), rec, 0, false);
			send_error(errors::internal_server_error);
			return;
		}

		m_state = state_t::streaming;

		if (m_request.head)
		{
			m_header = response_header();
			m_header_sent = true;
			boost::asio::async_write(*m_socket, boost::asio::buffer(m_header)
				, [s = shared_from_this()](error_code const& e, std::size_t)
				{ s->on_write(e, 0); });
			return;
		}

		m_buffer.resize(std::size_t(std::min(std::int64_t(std::max(m_settings.send_buffer_size, 1))
			, m_range.size())));
		read_block();
	}

	void stream_responder::read_block()
	{
		std::int64_t const left = m_range.size() - m_bytes_sent;
		PIECESTREAM_ASSERT(left > 0);
		std::size_t const n = std::size_t(std::min(std::int64_t(m_buffer.size()), left));
		m_reader->async_read(boost::asio::buffer(m_buffer.data(), n)
			, [s = shared_from_this()](error_code const& ec, std::size_t const bytes)
			{ s->on_read(ec, bytes); });
	}

	void stream_responder::on_read(error_code const& ec, std::size_t const bytes)
	{
		if (m_closed) return;

		if (ec)
		{
			if (m_alerts.should_post<stream_error_alert>())
			{
				m_alerts.emplace_alert<stream_error_alert>(m_transfer->id(), ec
					, m_bytes_sent, m_header_sent);
			}

			// once the header is out, the status can't be changed. All we
			// can do is to cut the response short
			if (!m_header_sent) send_error(errors::internal_server_error);
			else finish(state_t::failed, false);
			return;
		}

		std::vector<boost::asio::const_buffer> bufs;
		if (!m_header_sent)
		{
			m_header = response_header();
			m_header_sent = true;
			bufs.push_back(boost::asio::buffer(m_header));

			m_started_alert = true;
			if (m_alerts.should_post<stream_started_alert>())
			{
				m_alerts.emplace_alert<stream_started_alert>(m_transfer->id()
					, m_range, m_content_length);
			}
		}
		bufs.push_back(boost::asio::buffer(m_buffer.data(), bytes));

		boost::asio::async_write(*m_socket, bufs
			, [s = shared_from_this(), bytes](error_code const& e, std::size_t)
			{ s->on_write(e, bytes); });
	}

	void stream_responder::on_write(error_code const& ec, std::size_t const bytes)
	{
		if (m_closed) return;

		if (ec)
		{
			finish(state_t::aborted, false);
			return;
		}

		m_bytes_sent += std::int64_t(bytes);
		if (m_request.head || m_bytes_sent == m_range.size())
		{
			finish(state_t::completed, true);
			return;
		}
		read_block();
	}

	void stream_responder::send_error(int const status)
	{
		if (m_closed) return;
		PIECESTREAM_ASSERT(!m_header_sent);

		http_header_list headers;
		if (status == errors::range_not_satisfiable_status)
		{
			headers.emplace_back("Content-Range", unsatisfied_content_range(m_content_length));
			headers.emplace_back("Accept-Ranges", "bytes");
		}
		headers.emplace_back("Content-Length", "0");

		bool const keep_alive = m_request.keep_alive;
		if (!keep_alive) headers.emplace_back("Connection", "close");

		m_state = state_t::failed;
		m_header = format_response_header(status, headers);
		m_header_sent = true;

		boost::asio::async_write(*m_socket, boost::asio::buffer(m_header)
			, [s = shared_from_this(), keep_alive](error_code const& e, std::size_t)
			{ s->on_error_sent(e, keep_alive); });
	}

	void stream_responder::on_error_sent(error_code const& ec, bool const keep_alive)
	{
		if (m_closed) return;
		finish(state_t::failed, keep_alive && !ec);
	}

	std::string stream_responder::response_header() const
	{
		http_header_list headers;
		headers.emplace_back("Content-Type", m_settings.content_type);
		headers.emplace_back("Content-Length", std::to_string(m_range.size()));
		headers.emplace_back("Content-Range", m_range.content_range(m_content_length));
		headers.emplace_back("Accept-Ranges", "bytes");
		if (m_settings.cache_control_no_cache)
			headers.emplace_back("Cache-Control", "no-cache");
		if (!m_request.keep_alive)
			headers.emplace_back("Connection", "close");
		return format_response_header(errors::partial_content, headers);
	}

	void stream_responder::finish(state_t const s, bool const keep_alive)
	{
		if (m_closed) return;

		if (m_started_alert && m_alerts.should_post<stream_finished_alert>())
		{
			m_alerts.emplace_alert<stream_finished_alert>(m_transfer->id(), m_range
				, m_bytes_sent, s == state_t::completed);
		}

		m_state = s;
		cleanup();

		done_handler h = std::move(m_done);
		m_done = nullptr;
		if (h) h(keep_alive && m_request.keep_alive);
	}

	void stream_responder::abort()
	{
		if (m_closed) return;

		if (m_started_alert && m_alerts.should_post<stream_finished_alert>())
		{
			m_alerts.emplace_alert<stream_finished_alert>(m_transfer->id(), m_range
				, m_bytes_sent, false);
		}

		m_state = state_t::aborted;
		m_done = nullptr;
		cleanup();
	}

	void stream_responder::cleanup()
	{
		if (m_closed) return;
		m_closed = true;

		m_timer.cancel();
		if (m_subscribed)
		{
			m_transfer->engine().unsubscribe(m_subscription);
			m_subscribed = false;
		}
		if (m_wait)
		{
			m_wait->cancel();
			m_wait.reset();
		}
		if (m_reader)
		{
			m_reader->close();
			m_reader.reset();
		}
		m_transfer->stream_finished();
	}
}}
