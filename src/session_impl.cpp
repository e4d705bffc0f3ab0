/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include "piecestream/aux_/session_impl.hpp"
#include "piecestream/aux_/http_connection.hpp"
#include "piecestream/aux_/response_buffer.hpp"
#include "piecestream/aux_/string_util.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/bounded_piece_cache.hpp"
#include "piecestream/media_file.hpp"
#include "piecestream/piece_range.hpp"
#include "piecestream/assert.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/ip/address.hpp>

#include <algorithm>
#include <cinttypes>

namespace piecestream { namespace aux {

namespace {

	std::int64_t const mebibyte = 1024 * 1024;

	void append_ranges(std::string& out, std::vector<piece_index_range> const& ranges)
	{
		out += "[";
		bool first = true;
		for (auto const& r : ranges)
		{
			appendf(out, "%s[%d,%d]", first ? "" : ","
				, static_cast<int>(r.first), static_cast<int>(r.last));
			first = false;
		}
		out += "]";
	}

	settings_pack merged_settings(settings_pack const& pack)
	{
		settings_pack ret = default_settings();
		apply_pack(pack, ret);
		return ret;
	}
}

	session_impl::session_impl(boost::asio::io_context& ioc, settings_pack const& pack)
		: m_io_context(ioc)
		, m_settings(merged_settings(pack))
		, m_alerts(m_settings.get_int(settings_pack::alert_queue_size)
			, alert_category_t(std::uint32_t(m_settings.get_int(settings_pack::alert_mask))))
		, m_budget(std::make_shared<global_memory_budget>(
			std::int64_t(m_settings.get_int(settings_pack::max_memory_usage)) * mebibyte))
		, m_acceptor(ioc)
	{
		// evictions are reported from whatever thread put the chunk that
		// caused them. The alert_manager is thread safe
		alert_manager* alerts = &m_alerts;
		m_budget->set_eviction_observer([alerts](evicted_chunk const& c)
		{
			if (alerts->should_post<chunk_evicted_alert>())
				alerts->emplace_alert<chunk_evicted_alert>(c.owner, c.piece, c.size);
		});
	}

	session_impl::~session_impl()
	{
		// the budget may outlive us, held by the caches of engines still
		// referenced elsewhere
		m_budget->set_eviction_observer({});
	}

	void session_impl::apply_settings(settings_pack const& pack)
	{
		std::int64_t max_bytes = 0;
		{
			std::lock_guard<std::mutex> l(m_settings_mutex);
			apply_pack(pack, m_settings);
			max_bytes = std::int64_t(m_settings.get_int(settings_pack::max_memory_usage)) * mebibyte;
			m_alerts.set_alert_mask(alert_category_t(
				std::uint32_t(m_settings.get_int(settings_pack::alert_mask))));
			m_alerts.set_alert_queue_size_limit(m_settings.get_int(settings_pack::alert_queue_size));
		}

		if (pack.has_val(settings_pack::max_memory_usage))
			m_budget->set_max_bytes(max_bytes);
	}

	settings_pack session_impl::get_settings() const
	{
		std::lock_guard<std::mutex> l(m_settings_mutex);
		return m_settings;
	}

	void session_impl::listen(error_code& ec)
	{
		std::string iface;
		int port = 0;
		{
			std::lock_guard<std::mutex> l(m_settings_mutex);
			iface = m_settings.get_str(settings_pack::listen_interface);
			port = m_settings.get_int(settings_pack::listen_port);
		}

		auto fail = [&](error_code const& e)
		{
			ec = e;
			error_code ignore;
			m_acceptor.close(ignore);
			if (m_alerts.should_post<listen_failed_alert>())
				m_alerts.emplace_alert<listen_failed_alert>(iface, port, e);
		};

		using boost::asio::ip::tcp;
		error_code e;
		auto const addr = boost::asio::ip::make_address(iface, e);
		if (e) { fail(e); return; }

		tcp::endpoint const ep(addr, std::uint16_t(port));
		m_acceptor.open(ep.protocol(), e);
		if (e) { fail(e); return; }
		m_acceptor.set_option(tcp::acceptor::reuse_address(true), e);
		if (e) { fail(e); return; }
		m_acceptor.bind(ep, e);
		if (e) { fail(e); return; }
		m_acceptor.listen(boost::asio::socket_base::max_listen_connections, e);
		if (e) { fail(e); return; }

		if (m_alerts.should_post<listen_succeeded_alert>())
			m_alerts.emplace_alert<listen_succeeded_alert>(m_acceptor.local_endpoint(e));

		start_accept();
	}

	boost::asio::ip::tcp::endpoint session_impl::listen_endpoint() const
	{
		error_code ec;
		if (!m_acceptor.is_open()) return {};
		return m_acceptor.local_endpoint(ec);
	}

	void session_impl::start_accept()
	{
		m_acceptor.async_accept(
			[self = shared_from_this()](error_code const& ec, boost::asio::ip::tcp::socket s)
			{ self->on_accept(ec, std::move(s)); });
	}

	void session_impl::on_accept(error_code const& ec, boost::asio::ip::tcp::socket s)
	{
		if (ec == boost::asio::error::operation_aborted || m_abort) return;
		if (ec)
		{
			if (m_alerts.should_post<session_log_alert>())
				m_alerts.emplace_alert<session_log_alert>("accept failed: " + ec.message());
			if (!m_acceptor.is_open()) return;
			start_accept();
			return;
		}

		int max_header = 0;
		time_duration idle{};
		{
			std::lock_guard<std::mutex> l(m_settings_mutex);
			max_header = m_settings.get_int(settings_pack::max_request_header_size);
			idle = seconds(m_settings.get_int(settings_pack::connection_idle_timeout));
		}

		auto c = std::make_shared<http_connection>(shared_from_this(), std::move(s)
			, max_header, idle);
		m_connections.insert(c);
		c->start();
		start_accept();
	}

	void session_impl::remove_connection(http_connection* c)
	{
		auto const it = std::find_if(m_connections.begin(), m_connections.end()
			, [c](std::shared_ptr<http_connection> const& e) { return e.get() == c; });
		if (it != m_connections.end()) m_connections.erase(it);
	}

	void session_impl::add_transfer(std::string const& id
		, piece_engine_constructor const& f, error_code& ec)
	{
		if (m_abort)
		{
			ec = boost::asio::error::operation_aborted;
			return;
		}

		{
			std::lock_guard<std::mutex> l(m_mutex);
			if (m_transfers.count(id))
			{
				ec = errors::duplicate_transfer;
				return;
			}
		}

		// record the owner of every store the engine creates, so removing the
		// transfer releases its memory even if the engine is kept alive
		auto owners = std::make_shared<std::vector<owner_id_t>>();
		auto const make_cache = bounded_cache_constructor(m_budget);
		piece_engine_params params(m_io_context, [owners, make_cache]()
		{
			std::unique_ptr<chunk_store> s = make_cache();
			owners->push_back(static_cast<bounded_piece_cache&>(*s).owner());
			return s;
		});

		std::shared_ptr<piece_engine> engine = f(std::move(params));
		if (!engine)
		{
			ec = errc::make_error_code(errc::invalid_argument);
			return;
		}

		auto t = std::make_shared<transfer>(m_io_context, id, std::move(engine), &m_alerts);
		for (owner_id_t const o : *owners) t->add_owner(o);

		{
			std::lock_guard<std::mutex> l(m_mutex);
			// the factory ran without the lock held
			if (!m_transfers.emplace(id, t).second)
			{
				ec = errors::duplicate_transfer;
				return;
			}
		}

		if (m_alerts.should_post<transfer_added_alert>())
			m_alerts.emplace_alert<transfer_added_alert>(id, t->name());
	}

	void session_impl::remove_transfer(std::string const& id, error_code& ec)
	{
		std::shared_ptr<transfer> t;
		{
			std::lock_guard<std::mutex> l(m_mutex);
			auto const it = m_transfers.find(id);
			if (it == m_transfers.end())
			{
				ec = errors::transfer_not_found;
				return;
			}
			t = std::move(it->second);
			m_transfers.erase(it);
		}

		t->abort();
		for (owner_id_t const o : t->owners()) m_budget->close(o);

		// the connections are only touched on the io_context
		boost::asio::post(m_io_context, [self = shared_from_this(), t]
			{ self->abort_streams(t.get()); });

		if (m_alerts.should_post<transfer_removed_alert>())
			m_alerts.emplace_alert<transfer_removed_alert>(id);
	}

	void session_impl::abort_streams(transfer const* t)
	{
		std::vector<std::shared_ptr<http_connection>> streaming;
		for (auto const& c : m_connections)
			if (c->is_streaming(t)) streaming.push_back(c);
		for (auto const& c : streaming) c->close();
	}

	std::shared_ptr<transfer> session_impl::find_transfer(std::string const& id) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const it = m_transfers.find(id);
		if (it == m_transfers.end()) return {};
		return it->second;
	}

	std::vector<std::string> session_impl::transfer_ids() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		std::vector<std::string> ret;
		ret.reserve(m_transfers.size());
		for (auto const& t : m_transfers) ret.push_back(t.first);
		return ret;
	}

	transfer_status session_impl::status(std::string const& id, error_code& ec) const
	{
		transfer_status st;
		std::shared_ptr<transfer> t = find_transfer(id);
		if (!t)
		{
			ec = errors::transfer_not_found;
			return st;
		}

		piece_engine const& e = t->engine();
		st.id = t->id();
		st.name = t->name();
		st.content_length = e.content_length();
		st.piece_length = e.piece_length();
		st.num_pieces = e.num_pieces();

		std::vector<bool> const have = downloaded_pieces(e);
		st.num_downloaded = int(std::count(have.begin(), have.end(), true));
		st.downloaded = piece_ranges(have);
		st.prioritized = t->scheduler().prioritized().spans();

		for (owner_id_t const o : t->owners())
			st.cache_bytes += m_budget->owner_bytes(o);
		st.active_streams = t->active_streams();
		return st;
	}

	void session_impl::abort()
	{
		if (m_abort) return;
		m_abort = true;

		error_code ec;
		m_acceptor.close(ec);

		// closing a connection removes it from m_connections
		std::vector<std::shared_ptr<http_connection>> conns(
			m_connections.begin(), m_connections.end());
		for (auto const& c : conns) c->close();
		m_connections.clear();

		std::map<std::string, std::shared_ptr<transfer>> transfers;
		{
			std::lock_guard<std::mutex> l(m_mutex);
			transfers.swap(m_transfers);
		}
		for (auto const& t : transfers)
		{
			t.second->abort();
			for (owner_id_t const o : t.second->owners()) m_budget->close(o);
		}
	}

	void session_impl::post_memory_usage()
	{
		if (!m_alerts.should_post<memory_usage_alert>()) return;
		m_alerts.emplace_alert<memory_usage_alert>(m_budget->total_bytes()
			, m_budget->max_bytes(), m_budget->num_chunks(), m_budget->stats().evictions);
	}

	stream_settings session_impl::stream_settings_for(transfer const& t) const
	{
		std::lock_guard<std::mutex> l(m_settings_mutex);
		stream_settings s;
		s.max_chunk_size = m_settings.get_int(settings_pack::max_chunk_size);
		s.initial_chunk_size = m_settings.get_int(settings_pack::initial_chunk_size);
		s.read_ahead_bytes = m_settings.get_int(settings_pack::read_ahead_bytes);
		s.piece_wait_timeout = milliseconds(m_settings.get_int(settings_pack::piece_wait_timeout));
		s.metadata_timeout = milliseconds(m_settings.get_int(settings_pack::metadata_timeout));
		s.send_buffer_size = m_settings.get_int(settings_pack::send_buffer_size);
		s.cache_control_no_cache = m_settings.get_bool(settings_pack::cache_control_no_cache);
		s.content_type = mime_type_for(t.name(), m_settings.get_str(settings_pack::content_type));
		return s;
	}

	void session_impl::send_error(http_connection& c, int const status
		, error_code const& ec, std::string const& target, bool const keep_alive)
	{
		if (m_alerts.should_post<request_error_alert>())
			m_alerts.emplace_alert<request_error_alert>(c.remote(), status, target, ec);

		http_header_list headers;
		if (status == errors::method_not_allowed)
			headers.emplace_back("Allow", target == "/transfer" ? "DELETE"
				: target == "/stream" ? "GET, HEAD" : "GET");
		c.send_response(status, std::move(headers), {}, keep_alive);
	}

	void session_impl::handle_request(std::shared_ptr<http_connection> const& c
		, http_request_parser const& req)
	{
		bool const keep_alive = req.keep_alive()
			&& get_settings().get_bool(settings_pack::keep_alive);

		error_code ec;
		request_target const target = parse_request_target(req.path(), ec);
		if (ec)
		{
			send_error(*c, errors::bad_request, ec, req.path(), keep_alive);
			return;
		}

		std::string const& method = req.method();
		bool const is_get = method == "get" || method == "head";

		if (target.path == "/transfers")
		{
			if (!is_get)
			{
				send_error(*c, errors::method_not_allowed, errors::unsupported_method
					, target.path, keep_alive);
				return;
			}
			c->send_response(errors::ok, {{"Content-Type", "application/json"}}
				, transfers_json(), keep_alive);
			return;
		}

		if (target.path != "/stream"
			&& target.path != "/status"
			&& target.path != "/transfer")
		{
			send_error(*c, errors::not_found, errors::http_parse_error
				, target.path, keep_alive);
			return;
		}

		bool const method_ok = target.path == "/transfer"
			? method == "delete" : is_get;
		if (!method_ok)
		{
			send_error(*c, errors::method_not_allowed, errors::unsupported_method
				, target.path, keep_alive);
			return;
		}

		std::string const id = transfer_id_from_query(target.query, ec);
		if (ec || id.empty())
		{
			send_error(*c, errors::bad_request
				, ec ? ec : error_code(errors::missing_transfer_id)
				, target.path, keep_alive);
			return;
		}

		if (target.path == "/transfer")
		{
			remove_transfer(id, ec);
			if (ec)
			{
				send_error(*c, errors::not_found, ec, target.path, keep_alive);
				return;
			}
			c->send_response(errors::no_content, {}, {}, keep_alive);
			return;
		}

		std::shared_ptr<transfer> t = find_transfer(id);
		if (!t)
		{
			send_error(*c, errors::not_found, errors::transfer_not_found
				, target.path, keep_alive);
			return;
		}

		if (target.path == "/status")
		{
			transfer_status const st = status(id, ec);
			if (ec)
			{
				send_error(*c, errors::not_found, ec, target.path, keep_alive);
				return;
			}
			c->send_response(errors::ok, {{"Content-Type", "application/json"}}
				, status_json(st), keep_alive);
			return;
		}

		stream_settings ss = stream_settings_for(*t);
		stream_request sr;
		sr.range = req.header("range");
		sr.head = method == "head";
		sr.keep_alive = keep_alive;
		c->send_stream(std::move(t), std::move(sr), std::move(ss));
	}

	std::string session_impl::transfers_json() const
	{
		std::string out = "{\"transfers\":[";
		bool first = true;
		for (std::string const& id : transfer_ids())
		{
			error_code ec;
			transfer_status const st = status(id, ec);
			// removed since we listed it
			if (ec) continue;

			appendf(out, "%s{\"id\":\"%s\",\"name\":\"%s\",\"content_length\":%" PRId64
				",\"piece_length\":%d,\"num_pieces\":%d,\"num_downloaded\":%d"
				",\"active_streams\":%d}"
				, first ? "" : ","
				, escape_json(st.id).c_str(), escape_json(st.name).c_str()
				, st.content_length, st.piece_length, st.num_pieces, st.num_downloaded
				, st.active_streams);
			first = false;
		}
		out += "]}";
		return out;
	}

	std::string session_impl::status_json(transfer_status const& st) const
	{
		std::string out;
		appendf(out, "{\"id\":\"%s\",\"name\":\"%s\",\"content_length\":%" PRId64
			",\"piece_length\":%d,\"num_pieces\":%d,\"num_downloaded\":%d"
			",\"downloaded\":"
			, escape_json(st.id).c_str(), escape_json(st.name).c_str()
			, st.content_length, st.piece_length, st.num_pieces, st.num_downloaded);
		append_ranges(out, st.downloaded);

		out += ",\"prioritized\":[";
		bool first = true;
		for (auto const& p : st.prioritized)
		{
			appendf(out, "%s{\"first\":%d,\"last\":%d,\"priority\":%d}"
				, first ? "" : ","
				, static_cast<int>(p.first.first), static_cast<int>(p.first.last)
				, int(static_cast<std::uint8_t>(p.second)));
			first = false;
		}

		appendf(out, "],\"cache_bytes\":%" PRId64 ",\"active_streams\":%d"
			",\"budget\":{\"total_bytes\":%" PRId64 ",\"max_bytes\":%" PRId64
			",\"num_chunks\":%d,\"evictions\":%" PRId64 "}}"
			, st.cache_bytes, st.active_streams
			, m_budget->total_bytes(), m_budget->max_bytes()
			, m_budget->num_chunks(), m_budget->stats().evictions);
		return out;
	}
}}
