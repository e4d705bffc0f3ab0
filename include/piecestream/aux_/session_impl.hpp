/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_SESSION_IMPL_HPP_INCLUDED
#define PIECESTREAM_SESSION_IMPL_HPP_INCLUDED

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "piecestream/config.hpp"
#include "piecestream/alert_manager.hpp"
#include "piecestream/memory_budget.hpp"
#include "piecestream/settings_pack.hpp"
#include "piecestream/transfer.hpp"
#include "piecestream/http_parser.hpp"
#include "piecestream/aux_/stream_responder.hpp"

namespace piecestream { namespace aux {

	class http_connection;

	// the state behind a session: the memory budget, the alert queue, the
	// registered transfers and the HTTP server.
	//
	// Everything touching the acceptor and the connections runs on the
	// io_context. The transfer registry and the settings may also be
	// accessed from other threads.
	class session_impl : public std::enable_shared_from_this<session_impl>
	{
	public:
		session_impl(boost::asio::io_context& ioc, settings_pack const& pack);
		~session_impl();

		session_impl(session_impl const&) = delete;
		session_impl& operator=(session_impl const&) = delete;

		void apply_settings(settings_pack const& pack);
		settings_pack get_settings() const;

		void listen(error_code& ec);
		boost::asio::ip::tcp::endpoint listen_endpoint() const;

		void add_transfer(std::string const& id, piece_engine_constructor const& f
			, error_code& ec);
		void remove_transfer(std::string const& id, error_code& ec);
		std::shared_ptr<transfer> find_transfer(std::string const& id) const;
		std::vector<std::string> transfer_ids() const;
		transfer_status status(std::string const& id, error_code& ec) const;

		// closes the acceptor and every connection, aborting the streams in
		// flight, and releases every transfer
		void abort();
		bool is_aborted() const { return m_abort; }

		void post_memory_usage();

		alert_manager& alerts() { return m_alerts; }
		global_memory_budget& budget() { return *m_budget; }
		boost::asio::io_context& get_context() { return m_io_context; }

		// called by http_connection once a request has been parsed
		void handle_request(std::shared_ptr<http_connection> const& c
			, http_request_parser const& req);
		void remove_connection(http_connection* c);

	private:

		void start_accept();
		void on_accept(error_code const& ec, boost::asio::ip::tcp::socket s);

		void send_error(http_connection& c, int status, error_code const& ec
			, std::string const& target, bool keep_alive);

		stream_settings stream_settings_for(transfer const& t) const;

		std::string transfers_json() const;
		std::string status_json(transfer_status const& st) const;

		// aborts the streams of a removed transfer. Runs on the io_context
		void abort_streams(transfer const* t);

		boost::asio::io_context& m_io_context;

		mutable std::mutex m_settings_mutex;
		settings_pack m_settings;

		alert_manager m_alerts;

		// shared with every cache, so it outlives them
		std::shared_ptr<global_memory_budget> m_budget;

		mutable std::mutex m_mutex;
		std::map<std::string, std::shared_ptr<transfer>> m_transfers;

		boost::asio::ip::tcp::acceptor m_acceptor;
		std::set<std::shared_ptr<http_connection>> m_connections;

		bool m_abort = false;
	};
}}

#endif // PIECESTREAM_SESSION_IMPL_HPP_INCLUDED
