/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ALERT_TYPES_HPP_INCLUDED
#define PIECESTREAM_ALERT_TYPES_HPP_INCLUDED

#include <cstdint>
#include <string>

#include <boost/asio/ip/tcp.hpp>

#include "piecestream/config.hpp"
#include "piecestream/alert.hpp"
#include "piecestream/byte_range.hpp"
#include "piecestream/piece_range.hpp"
#include "piecestream/units.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream {

	// internal
	PIECESTREAM_EXPORT char const* alert_name(int alert_type);

	enum alert_priority
	{
		alert_priority_normal = 0,
		alert_priority_high,
		alert_priority_critical
	};

#define PIECESTREAM_DEFINE_ALERT_IMPL(name, seq, prio) \
	static const int priority = prio; \
	static const int alert_type = seq; \
	int type() const noexcept override { return alert_type; } \
	alert_category_t category() const noexcept override { return static_category; } \
	char const* what() const noexcept override { return alert_name(alert_type); }

#define PIECESTREAM_DEFINE_ALERT(name, seq) \
	PIECESTREAM_DEFINE_ALERT_IMPL(name, seq, alert_priority_normal)

#define PIECESTREAM_DEFINE_ALERT_PRIO(name, seq, prio) \
	PIECESTREAM_DEFINE_ALERT_IMPL(name, seq, prio)

	// This is a base class for alerts that are associated with a specific
	// transfer. It contains the id of the transfer.
	struct PIECESTREAM_EXPORT transfer_alert : alert
	{
		// internal
		explicit transfer_alert(std::string id);

		// returns the message associated with this alert, prefixed with the
		// transfer id
		std::string message() const override;

		// the id of the transfer the alert is about
		std::string const transfer_id;
	};

	// posted when the HTTP listen socket is opened
	struct PIECESTREAM_EXPORT listen_succeeded_alert final : alert
	{
		// internal
		explicit listen_succeeded_alert(boost::asio::ip::tcp::endpoint const& ep);

		PIECESTREAM_DEFINE_ALERT_PRIO(listen_succeeded_alert, 0, alert_priority_critical)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		// the endpoint the server is listening on
		boost::asio::ip::tcp::endpoint const endpoint;
	};

	// posted when the HTTP listen socket cannot be opened
	struct PIECESTREAM_EXPORT listen_failed_alert final : alert
	{
		// internal
		listen_failed_alert(std::string iface, int port, error_code const& ec);

		PIECESTREAM_DEFINE_ALERT_PRIO(listen_failed_alert, 1, alert_priority_critical)

		static constexpr alert_category_t static_category
			= alert_category::status | alert_category::error;
		std::string message() const override;

		std::string const listen_interface;
		int const port;
		error_code const error;
	};

	// posted once a transfer has been added to the session
	struct PIECESTREAM_EXPORT transfer_added_alert final : transfer_alert
	{
		// internal
		transfer_added_alert(std::string id, std::string name);

		PIECESTREAM_DEFINE_ALERT(transfer_added_alert, 2)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;

		// the name reported by the piece engine
		std::string const name;
	};

	// posted once a transfer has been removed and its cache released
	struct PIECESTREAM_EXPORT transfer_removed_alert final : transfer_alert
	{
		// internal
		explicit transfer_removed_alert(std::string id);

		PIECESTREAM_DEFINE_ALERT(transfer_removed_alert, 3)

		static constexpr alert_category_t static_category = alert_category::status;
		std::string message() const override;
	};

	// posted for every HTTP request the server parses
	struct PIECESTREAM_EXPORT incoming_request_alert final : alert
	{
		// internal
		incoming_request_alert(boost::asio::ip::tcp::endpoint const& ep
			, std::string method, std::string target, std::string range);

		PIECESTREAM_DEFINE_ALERT(incoming_request_alert, 4)

		static constexpr alert_category_t static_category = alert_category::incoming_request;
		std::string message() const override;

		boost::asio::ip::tcp::endpoint const endpoint;
		std::string const method;
		std::string const target;

		// the value of the Range header, empty if there was none
		std::string const range;
	};

	// posted when a stream request is answered with 416 because its Range
	// header could not be parsed or lies outside the content
	struct PIECESTREAM_EXPORT range_rejected_alert final : transfer_alert
	{
		// internal
		range_rejected_alert(std::string id, std::string range
			, std::int64_t content_length, error_code const& ec);

		PIECESTREAM_DEFINE_ALERT(range_rejected_alert, 5)

		static constexpr alert_category_t static_category
			= alert_category::stream | alert_category::error;
		std::string message() const override;

		std::string const range;
		std::int64_t const content_length;
		error_code const error;
	};

	// posted when the piece priorities of a transfer are reset for a new
	// stream position
	struct PIECESTREAM_EXPORT pieces_prioritized_alert final : transfer_alert
	{
		// internal
		pieces_prioritized_alert(std::string id, piece_index_range required
			, piece_index_range buffered);

		PIECESTREAM_DEFINE_ALERT(pieces_prioritized_alert, 6)

		static constexpr alert_category_t static_category = alert_category::piece_progress;
		std::string message() const override;

		// the pieces overlapping the requested bytes
		piece_index_range const required;

		// the required pieces plus the read-ahead, all of which were
		// selected at critical priority
		piece_index_range const buffered;
	};

	// posted when the pieces of a stream request are all downloaded, either
	// immediately or after waiting
	struct PIECESTREAM_EXPORT piece_wait_alert final : transfer_alert
	{
		// internal
		piece_wait_alert(std::string id, piece_index_range pieces, time_duration waited);

		PIECESTREAM_DEFINE_ALERT(piece_wait_alert, 7)

		static constexpr alert_category_t static_category = alert_category::stream;
		std::string message() const override;

		piece_index_range const pieces;
		time_duration const waited;
	};

	// posted when the pieces of a stream request were not downloaded before
	// piece_wait_timeout. The response is sent anyway and may stall.
	struct PIECESTREAM_EXPORT piece_wait_timeout_alert final : transfer_alert
	{
		// internal
		piece_wait_timeout_alert(std::string id, piece_index_range pieces
			, int num_downloaded, time_duration timeout);

		PIECESTREAM_DEFINE_ALERT(piece_wait_timeout_alert, 8)

		static constexpr alert_category_t static_category
			= alert_category::performance_warning | alert_category::stream;
		std::string message() const override;

		piece_index_range const pieces;
		int const num_downloaded;
		time_duration const timeout;
	};

	// posted when the header of a 206 response has been sent
	struct PIECESTREAM_EXPORT stream_started_alert final : transfer_alert
	{
		// internal
		stream_started_alert(std::string id, byte_range range, std::int64_t content_length);

		PIECESTREAM_DEFINE_ALERT(stream_started_alert, 9)

		static constexpr alert_category_t static_category = alert_category::stream;
		std::string message() const override;

		byte_range const range;
		std::int64_t const content_length;
	};

	// posted exactly once for every stream response that was started,
	// whether it completed or the client went away
	struct PIECESTREAM_EXPORT stream_finished_alert final : transfer_alert
	{
		// internal
		stream_finished_alert(std::string id, byte_range range
			, std::int64_t bytes_sent, bool completed);

		PIECESTREAM_DEFINE_ALERT(stream_finished_alert, 10)

		static constexpr alert_category_t static_category = alert_category::stream;
		std::string message() const override;

		byte_range const range;

		// the number of body bytes written to the socket
		std::int64_t const bytes_sent;

		// false if the stream was cut short
		bool const completed;
	};

	// posted when reading from the piece engine fails while serving a
	// stream. If no bytes were sent yet, the client received a 500.
	struct PIECESTREAM_EXPORT stream_error_alert final : transfer_alert
	{
		// internal
		stream_error_alert(std::string id, error_code const& ec
			, std::int64_t bytes_sent, bool header_sent);

		PIECESTREAM_DEFINE_ALERT_PRIO(stream_error_alert, 11, alert_priority_high)

		static constexpr alert_category_t static_category
			= alert_category::stream | alert_category::error;
		std::string message() const override;

		error_code const error;
		std::int64_t const bytes_sent;
		bool const header_sent;
	};

	// posted when a chunk is evicted from the global memory budget
	struct PIECESTREAM_EXPORT chunk_evicted_alert final : alert
	{
		// internal
		chunk_evicted_alert(owner_id_t owner, piece_index_t piece, std::int64_t size);

		PIECESTREAM_DEFINE_ALERT(chunk_evicted_alert, 12)

		static constexpr alert_category_t static_category = alert_category::storage;
		std::string message() const override;

		owner_id_t const owner;
		piece_index_t const piece;
		std::int64_t const size;
	};

	// posted in response to session::post_memory_usage()
	struct PIECESTREAM_EXPORT memory_usage_alert final : alert
	{
		// internal
		memory_usage_alert(std::int64_t total, std::int64_t limit, int chunks
			, std::int64_t evictions);

		PIECESTREAM_DEFINE_ALERT(memory_usage_alert, 13)

		static constexpr alert_category_t static_category = alert_category::storage;
		std::string message() const override;

		std::int64_t const total_bytes;
		std::int64_t const max_bytes;
		int const num_chunks;
		std::int64_t const evictions;
	};

	// free-form log messages from the session
	struct PIECESTREAM_EXPORT session_log_alert final : alert
	{
		// internal
		explicit session_log_alert(std::string msg);

		PIECESTREAM_DEFINE_ALERT(session_log_alert, 14)

		static constexpr alert_category_t static_category = alert_category::session_log;
		std::string message() const override;

		// the log message
		char const* log_message() const { return m_msg.c_str(); }

	private:
		std::string const m_msg;
	};

	// posted when a request is answered with an error status other than
	// 416, e.g. an unknown transfer or a malformed request
	struct PIECESTREAM_EXPORT request_error_alert final : alert
	{
		// internal
		request_error_alert(boost::asio::ip::tcp::endpoint const& ep
			, int status, std::string target, error_code const& ec);

		PIECESTREAM_DEFINE_ALERT(request_error_alert, 15)

		static constexpr alert_category_t static_category
			= alert_category::incoming_request | alert_category::error;
		std::string message() const override;

		boost::asio::ip::tcp::endpoint const endpoint;
		int const status;
		std::string const target;
		error_code const error;
	};

	// free-form log messages about one transfer
	struct PIECESTREAM_EXPORT transfer_log_alert final : transfer_alert
	{
		// internal
		transfer_log_alert(std::string id, std::string msg);

		PIECESTREAM_DEFINE_ALERT(transfer_log_alert, 16)

		static constexpr alert_category_t static_category = alert_category::transfer_log;
		std::string message() const override;

		char const* log_message() const { return m_msg.c_str(); }

	private:
		std::string const m_msg;
	};

#undef PIECESTREAM_DEFINE_ALERT_IMPL
#undef PIECESTREAM_DEFINE_ALERT
#undef PIECESTREAM_DEFINE_ALERT_PRIO

	// the number of alert types. Useful for sizing per-type lookup tables
	constexpr int num_alert_types = 17;
}

#endif // PIECESTREAM_ALERT_TYPES_HPP_INCLUDED
