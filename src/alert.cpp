/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <array>
#include <cinttypes> // for PRId64 et.al.
#include <cstdio>
#include <string>
#include <utility>

#include "piecestream/config.hpp"
#include "piecestream/alert.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/aux_/string_util.hpp"

namespace piecestream {

	alert::alert() : m_timestamp(time_now()) {}
	alert::~alert() = default;
	time_point alert::timestamp() const { return m_timestamp; }

	namespace {

	std::string print_endpoint(boost::asio::ip::tcp::endpoint const& ep)
	{
		std::string const addr = ep.address().to_string();
		if (ep.address().is_v6())
			return "[" + addr + "]:" + std::to_string(ep.port());
		return addr + ":" + std::to_string(ep.port());
	}

	}

	transfer_alert::transfer_alert(std::string id)
		: transfer_id(std::move(id))
	{}

	std::string transfer_alert::message() const
	{
		return "[" + transfer_id + "]";
	}

	listen_succeeded_alert::listen_succeeded_alert(boost::asio::ip::tcp::endpoint const& ep)
		: endpoint(ep)
	{}

	std::string listen_succeeded_alert::message() const
	{
		return "listening on " + print_endpoint(endpoint);
	}

	listen_failed_alert::listen_failed_alert(std::string iface, int const p
		, error_code const& ec)
		: listen_interface(std::move(iface))
		, port(p)
		, error(ec)
	{}

	std::string listen_failed_alert::message() const
	{
		char ret[300];
		std::snprintf(ret, sizeof(ret), "listening on %s:%d failed: %s"
			, listen_interface.c_str(), port, error.message().c_str());
		return ret;
	}

	transfer_added_alert::transfer_added_alert(std::string id, std::string n)
		: transfer_alert(std::move(id))
		, name(std::move(n))
	{}

	std::string transfer_added_alert::message() const
	{
		return transfer_alert::message() + " added: " + name;
	}

	transfer_removed_alert::transfer_removed_alert(std::string id)
		: transfer_alert(std::move(id))
	{}

	std::string transfer_removed_alert::message() const
	{
		return transfer_alert::message() + " removed";
	}

	incoming_request_alert::incoming_request_alert(boost::asio::ip::tcp::endpoint const& ep
		, std::string m, std::string t, std::string r)
		: endpoint(ep)
		, method(std::move(m))
		, target(std::move(t))
		, range(std::move(r))
	{}

	std::string incoming_request_alert::message() const
	{
		std::string ret = print_endpoint(endpoint) + " " + method + " " + target;
		if (!range.empty()) ret += " Range: " + range;
		return ret;
	}

	range_rejected_alert::range_rejected_alert(std::string id, std::string r
		, std::int64_t const l, error_code const& ec)
		: transfer_alert(std::move(id))
		, range(std::move(r))
		, content_length(l)
		, error(ec)
	{}

	std::string range_rejected_alert::message() const
	{
		char ret[400];
		std::snprintf(ret, sizeof(ret), "%s invalid range \"%s\" for %" PRId64 " bytes: %s"
			, transfer_alert::message().c_str(), range.c_str(), content_length
			, error.message().c_str());
		return ret;
	}

	pieces_prioritized_alert::pieces_prioritized_alert(std::string id
		, piece_index_range const req, piece_index_range const buf)
		: transfer_alert(std::move(id))
		, required(req)
		, buffered(buf)
	{}

	std::string pieces_prioritized_alert::message() const
	{
		char ret[200];
		std::snprintf(ret, sizeof(ret), "%s prioritized pieces %d-%d (required %d-%d)"
			, transfer_alert::message().c_str()
			, static_cast<int>(buffered.first), static_cast<int>(buffered.last)
			, static_cast<int>(required.first), static_cast<int>(required.last));
		return ret;
	}

	piece_wait_alert::piece_wait_alert(std::string id, piece_index_range const p
		, time_duration const w)
		: transfer_alert(std::move(id))
		, pieces(p)
		, waited(w)
	{}

	std::string piece_wait_alert::message() const
	{
		char ret[200];
		std::snprintf(ret, sizeof(ret), "%s pieces %d-%d available after %" PRId64 " ms"
			, transfer_alert::message().c_str()
			, static_cast<int>(pieces.first), static_cast<int>(pieces.last)
			, total_milliseconds(waited));
		return ret;
	}

	piece_wait_timeout_alert::piece_wait_timeout_alert(std::string id
		, piece_index_range const p, int const n, time_duration const t)
		: transfer_alert(std::move(id))
		, pieces(p)
		, num_downloaded(n)
		, timeout(t)
	{}

	std::string piece_wait_timeout_alert::message() const
	{
		char ret[250];
		std::snprintf(ret, sizeof(ret), "%s timeout waiting for pieces %d-%d "
			"(%d/%d available after %" PRId64 " ms), streaming anyway"
			, transfer_alert::message().c_str()
			, static_cast<int>(pieces.first), static_cast<int>(pieces.last)
			, num_downloaded, pieces.num_pieces(), total_milliseconds(timeout));
		return ret;
	}

	stream_started_alert::stream_started_alert(std::string id, byte_range const r
		, std::int64_t const l)
		: transfer_alert(std::move(id))
		, range(r)
		, content_length(l)
	{}

	std::string stream_started_alert::message() const
	{
		char ret[300];
		double const progress = content_length > 0
			? double(range.start) * 100. / double(content_length) : 0.;
		std::snprintf(ret, sizeof(ret), "%s chunk request: bytes %" PRId64 "-%" PRId64
			" (%s) | position: %.1f%%"
			, transfer_alert::message().c_str(), range.start, range.end
			, aux::human_readable_bytes(range.size()).c_str(), progress);
		return ret;
	}

	stream_finished_alert::stream_finished_alert(std::string id, byte_range const r
		, std::int64_t const sent, bool const c)
		: transfer_alert(std::move(id))
		, range(r)
		, bytes_sent(sent)
		, completed(c)
	{}

	std::string stream_finished_alert::message() const
	{
		char ret[300];
		if (completed && bytes_sent == range.size())
		{
			std::snprintf(ret, sizeof(ret), "%s stream %" PRId64 "-%" PRId64 " finished: %s sent"
				, transfer_alert::message().c_str(), range.start, range.end
				, aux::human_readable_bytes(bytes_sent).c_str());
		}
		else if (completed)
		{
			std::snprintf(ret, sizeof(ret), "%s stream %" PRId64 "-%" PRId64
				" size mismatch: sent %" PRId64 " of %" PRId64 " bytes"
				, transfer_alert::message().c_str(), range.start, range.end
				, bytes_sent, range.size());
		}
		else
		{
			std::snprintf(ret, sizeof(ret), "%s stream %" PRId64 "-%" PRId64
				" aborted after %" PRId64 " of %" PRId64 " bytes"
				, transfer_alert::message().c_str(), range.start, range.end
				, bytes_sent, range.size());
		}
		return ret;
	}

	stream_error_alert::stream_error_alert(std::string id, error_code const& ec
		, std::int64_t const sent, bool const hs)
		: transfer_alert(std::move(id))
		, error(ec)
		, bytes_sent(sent)
		, header_sent(hs)
	{}

	std::string stream_error_alert::message() const
	{
		char ret[300];
		std::snprintf(ret, sizeof(ret), "%s stream error after %" PRId64 " bytes%s: %s"
			, transfer_alert::message().c_str(), bytes_sent
			, header_sent ? "" : " (sent 500)"
			, error.message().c_str());
		return ret;
	}

	chunk_evicted_alert::chunk_evicted_alert(owner_id_t const o
		, piece_index_t const p, std::int64_t const s)
		: owner(o)
		, piece(p)
		, size(s)
	{}

	std::string chunk_evicted_alert::message() const
	{
		char ret[200];
		std::snprintf(ret, sizeof(ret), "evicted piece %d of cache %u (%s)"
			, static_cast<int>(piece), static_cast<unsigned>(static_cast<std::uint32_t>(owner))
			, aux::human_readable_bytes(size).c_str());
		return ret;
	}

	memory_usage_alert::memory_usage_alert(std::int64_t const total
		, std::int64_t const limit, int const chunks, std::int64_t const e)
		: total_bytes(total)
		, max_bytes(limit)
		, num_chunks(chunks)
		, evictions(e)
	{}

	std::string memory_usage_alert::message() const
	{
		char ret[200];
		std::snprintf(ret, sizeof(ret), "memory: %s of %s in %d chunks, %" PRId64 " evictions"
			, aux::human_readable_bytes(total_bytes).c_str()
			, aux::human_readable_bytes(max_bytes).c_str()
			, num_chunks, evictions);
		return ret;
	}

	session_log_alert::session_log_alert(std::string msg)
		: m_msg(std::move(msg))
	{}

	std::string session_log_alert::message() const
	{
		return m_msg;
	}

	request_error_alert::request_error_alert(boost::asio::ip::tcp::endpoint const& ep
		, int const s, std::string t, error_code const& ec)
		: endpoint(ep)
		, status(s)
		, target(std::move(t))
		, error(ec)
	{}

	std::string request_error_alert::message() const
	{
		char ret[400];
		std::snprintf(ret, sizeof(ret), "%s %s: %d %s (%s)"
			, print_endpoint(endpoint).c_str(), target.c_str()
			, status, http_status_message(status), error.message().c_str());
		return ret;
	}

	transfer_log_alert::transfer_log_alert(std::string id, std::string msg)
		: transfer_alert(std::move(id))
		, m_msg(std::move(msg))
	{}

	std::string transfer_log_alert::message() const
	{
		return transfer_alert::message() + " " + m_msg;
	}

	char const* alert_name(int const alert_type)
	{
		static std::array<char const*, num_alert_types> const names = {{
		"listen_succeeded", "listen_failed", "transfer_added",
		"transfer_removed", "incoming_request", "range_rejected",
		"pieces_prioritized", "piece_wait", "piece_wait_timeout",
		"stream_started", "stream_finished", "stream_error",
		"chunk_evicted", "memory_usage", "session_log",
		"request_error", "transfer_log"
		}};

		if (alert_type < 0 || alert_type >= int(names.size())) return "";
		return names[std::size_t(alert_type)];
	}
}
