/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_STREAM_RESPONDER_HPP_INCLUDED
#define PIECESTREAM_STREAM_RESPONDER_HPP_INCLUDED

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "piecestream/config.hpp"
#include "piecestream/byte_range.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/piece_scheduler.hpp"
#include "piecestream/time.hpp"

namespace piecestream {

	class alert_manager;
	class transfer;

namespace aux {

	// the settings a stream response is served with. They are captured when
	// the request arrives
	struct stream_settings
	{
		std::int64_t max_chunk_size = 0;
		std::int64_t initial_chunk_size = 0;
		std::int64_t read_ahead_bytes = 0;
		time_duration piece_wait_timeout{0};
		time_duration metadata_timeout{0};
		int send_buffer_size = 0;
		bool cache_control_no_cache = true;
		std::string content_type;
	};

	struct stream_request
	{
		// the value of the Range header, empty if there was none
		std::string range;

		// only send the response header
		bool head = false;

		// if false, the response carries ``Connection: close``
		bool keep_alive = true;
	};

	// serves one stream request of one transfer:
	//
	// 1. wait for the engine to know the content length (or 503)
	// 2. resolve the Range header against it (or 416)
	// 3. prioritize the pieces of the range and wait for them, up to
	//    piece_wait_timeout. A timeout is not an error
	// 4. stream the bytes of the range as a 206 response
	//
	// The response header is only written together with the first bytes of
	// the body, so a failure to read from the engine before that is still
	// answered with a 500.
	class stream_responder : public std::enable_shared_from_this<stream_responder>
	{
	public:

		enum class state_t : std::uint8_t
		{
			waiting_metadata,
			waiting_pieces,
			streaming,
			completed,
			aborted,
			failed
		};

		// called once the response is complete, either successfully or with
		// an error response. ``keep_alive`` is false if the connection must
		// be closed. It is not called when the response is abort()ed
		using done_handler = std::function<void(bool keep_alive)>;

		stream_responder(std::shared_ptr<boost::asio::ip::tcp::socket> sock
			, std::shared_ptr<transfer> t
			, stream_request req
			, stream_settings s
			, alert_manager& alerts
			, done_handler h);
		~stream_responder();

		stream_responder(stream_responder const&) = delete;
		stream_responder& operator=(stream_responder const&) = delete;

		void start();

		// stops the response, because the client went away or the session is
		// shutting down. Cancels the piece wait and closes the byte reader.
		// Calling it more than once, or after the response completed, has
		// no effect
		void abort();

		state_t state() const { return m_state; }
		byte_range const& range() const { return m_range; }
		std::int64_t bytes_sent() const { return m_bytes_sent; }
		bool header_sent() const { return m_header_sent; }
		transfer const* get_transfer() const { return m_transfer.get(); }

	private:

		void wait_for_metadata();
		void on_metadata_timeout(error_code const& ec);
		void on_metadata();
		void start_response();
		void on_pieces_ready(error_code const& ec);
		void read_block();
		void on_read(error_code const& ec, std::size_t bytes);
		void on_write(error_code const& ec, std::size_t bytes);

		// sends a response without body and completes
		void send_error(int status);
		void on_error_sent(error_code const& ec, bool keep_alive);

		std::string response_header() const;

		// releases the reader, the wait and the subscriptions. Runs at most
		// once
		void cleanup();
		void finish(state_t s, bool keep_alive);

		std::shared_ptr<boost::asio::ip::tcp::socket> m_socket;
		std::shared_ptr<transfer> m_transfer;
		stream_request const m_request;
		stream_settings const m_settings;
		alert_manager& m_alerts;
		done_handler m_done;

		boost::asio::steady_timer m_timer;
		subscription_id m_subscription = 0;
		bool m_subscribed = false;

		std::shared_ptr<readiness_wait> m_wait;
		std::unique_ptr<byte_reader> m_reader;

		std::int64_t m_content_length = 0;
		byte_range m_range;

		std::vector<char> m_buffer;
		std::string m_header;
		std::int64_t m_bytes_sent = 0;

		state_t m_state = state_t::waiting_metadata;
		bool m_header_sent = false;
		bool m_started_alert = false;
		bool m_closed = false;
	};
}}

#endif // PIECESTREAM_STREAM_RESPONDER_HPP_INCLUDED
