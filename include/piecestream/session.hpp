/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_SESSION_HPP_INCLUDED
#define PIECESTREAM_SESSION_HPP_INCLUDED

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "piecestream/config.hpp"
#include "piecestream/error_code.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/settings_pack.hpp"
#include "piecestream/transfer.hpp"
#include "piecestream/time.hpp"

namespace piecestream {

	struct alert;
	class global_memory_budget;

namespace aux {
	class session_impl;
}

	// The session owns the global memory budget, the alert queue, the
	// registered transfers and the HTTP server streaming them. It runs on
	// an io_context owned by the caller, which must outlive it.
	//
	// listen() and stop() must be called from the thread running the
	// io_context, or before it is run. The remaining functions are thread
	// safe.
	class PIECESTREAM_EXPORT session
	{
	public:

		explicit session(boost::asio::io_context& ioc
			, settings_pack const& pack = default_settings());

		// aborts every stream in flight and releases every transfer
		~session();

		session(session const&) = delete;
		session& operator=(session const&) = delete;

		// applies the settings in ``pack`` on top of the current ones. Alert
		// settings and the memory limit take effect immediately, the rest
		// for subsequent requests
		void apply_settings(settings_pack const& pack);
		settings_pack get_settings() const;

		// opens the listen socket on listen_interface and listen_port and
		// starts accepting connections. A listen_port of 0 picks an
		// ephemeral port, see listen_endpoint(). Posts listen_succeeded_alert
		// or listen_failed_alert
		void listen(error_code& ec);
		boost::asio::ip::tcp::endpoint listen_endpoint() const;

		// registers a transfer under ``id``. The constructor is called
		// immediately with the chunk_store_constructor the engine must keep
		// its pieces in. Fails with duplicate_transfer if the id is taken.
		void add_transfer(std::string const& id, piece_engine_constructor const& f
			, error_code& ec);

		// releases the transfer's pieces from the memory budget and aborts
		// its streams
		void remove_transfer(std::string const& id, error_code& ec);

		std::shared_ptr<transfer> find_transfer(std::string const& id) const;
		std::vector<std::string> transfers() const;
		transfer_status status(std::string const& id, error_code& ec) const;

		// closes the listen socket, aborts every stream in flight and
		// releases every transfer. The session can't be restarted.
		void stop();

		// posts a memory_usage_alert with the budget's counters
		void post_memory_usage();

		global_memory_budget& memory_budget();

		// moves the alerts in the queue to ``alerts``. The alert objects stay
		// valid until the next call to pop_alerts()
		void pop_alerts(std::vector<alert*>* alerts);

		// blocks until an alert is available or ``max_wait`` passes. The
		// returned alert is not popped
		alert* wait_for_alert(time_duration max_wait);

		// ``fun`` is called, from an arbitrary thread, whenever the alert
		// queue goes from empty to non-empty. It must not block
		void set_alert_notify(std::function<void()> const& fun);

	private:
		std::shared_ptr<aux::session_impl> m_impl;
	};
}

#endif // PIECESTREAM_SESSION_HPP_INCLUDED
