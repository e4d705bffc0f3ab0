/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_PIECE_SCHEDULER_HPP_INCLUDED
#define PIECESTREAM_PIECE_SCHEDULER_HPP_INCLUDED

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "piecestream/config.hpp"
#include "piecestream/byte_range.hpp"
#include "piecestream/piece_range.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/download_priority.hpp"
#include "piecestream/error_code.hpp"
#include "piecestream/time.hpp"

namespace piecestream {

	class alert_manager;

	struct PIECESTREAM_EXPORT prioritized_piece
	{
		piece_priority_t priority{0};
		time_point selected_at;
	};

	// the set of pieces one transfer has asked its engine for, and at which
	// priority. It mirrors the select() and deselect() calls made on the
	// engine.
	class PIECESTREAM_EXPORT prioritized_pieces
	{
	public:

		// tracks every piece in [first, last] at ``prio``. Pieces already
		// tracked at the same or a higher priority are left alone
		void select(piece_index_t first, piece_index_t last, piece_priority_t prio
			, time_point now = time_now());

		// stops tracking the pieces in [first, last] whose priority is
		// exactly ``prio``
		void deselect(piece_index_t first, piece_index_t last, piece_priority_t prio);

		// none_priority for pieces that are not tracked
		piece_priority_t priority(piece_index_t piece) const;
		bool contains(piece_index_t piece) const;

		int size() const { return int(m_pieces.size()); }
		bool empty() const { return m_pieces.empty(); }
		void clear() { m_pieces.clear(); }

		// stops tracking every piece the engine reports as downloaded.
		// Returns the number of pieces removed. If ``removed`` is set, the
		// removed pieces and the priority they were tracked at are appended
		// to it
		int remove_downloaded(piece_engine const& e
			, std::vector<std::pair<piece_index_t, piece_priority_t>>* removed = nullptr);

		// the tracked pieces as runs of consecutive indices with the same
		// priority
		std::vector<std::pair<piece_index_range, piece_priority_t>> spans() const;

		std::map<piece_index_t, prioritized_piece> const& pieces() const
		{ return m_pieces; }

	private:
		std::map<piece_index_t, prioritized_piece> m_pieces;
	};

	// a pending piece_scheduler::async_wait_ready(). Dropping the handle
	// does not cancel the wait.
	class PIECESTREAM_EXPORT readiness_wait
		: public std::enable_shared_from_this<readiness_wait>
	{
	public:
		using handler = std::function<void(error_code const&)>;

		// internal
		readiness_wait(boost::asio::io_context& ioc
			, std::shared_ptr<piece_engine> engine
			, piece_index_range pieces, handler h);
		~readiness_wait();

		readiness_wait(readiness_wait const&) = delete;
		readiness_wait& operator=(readiness_wait const&) = delete;

		// completes the wait with boost::asio::error::operation_aborted,
		// unless it has completed already. Must be called on the event loop
		void cancel();

		bool done() const { return m_done; }
		piece_index_range pieces() const { return m_pieces; }

		// internal
		void start(time_duration timeout);
		void fail(error_code const& ec);

	private:

		void on_progress();
		void on_timeout(error_code const& ec);
		void complete(error_code const& ec);

		boost::asio::io_context& m_ioc;
		std::shared_ptr<piece_engine> m_engine;
		piece_index_range const m_pieces;
		handler m_handler;
		boost::asio::steady_timer m_timer;
		subscription_id m_subscription = 0;
		bool m_subscribed = false;
		bool m_done = false;
	};

	// translates byte ranges of stream requests into piece priorities on one
	// transfer's engine, and waits for those pieces to arrive.
	class PIECESTREAM_EXPORT piece_scheduler
	{
	public:
		piece_scheduler(boost::asio::io_context& ioc
			, std::shared_ptr<piece_engine> engine
			, std::string transfer_id
			, alert_manager* alerts = nullptr);

		piece_scheduler(piece_scheduler const&) = delete;
		piece_scheduler& operator=(piece_scheduler const&) = delete;

		// deselects every piece previously prioritized by this scheduler,
		// then selects the pieces of ``r``, extended by ``read_ahead`` bytes,
		// at critical priority. Returns the range that was selected. If the
		// engine doesn't know its piece length yet, nothing is changed and
		// ec is set to metadata_not_ready.
		piece_index_range prioritize(byte_range const& r, std::int64_t read_ahead
			, error_code& ec);

		// calls ``h`` on the event loop once every piece overlapping ``r`` is
		// downloaded, or with errors::readiness_timeout once ``timeout`` has
		// passed. The handler is called exactly once. If the pieces can't be
		// determined, the handler receives metadata_not_ready.
		std::shared_ptr<readiness_wait> async_wait_ready(byte_range const& r
			, time_duration timeout, readiness_wait::handler h);

		// deselects everything this scheduler has selected
		void clear();

		// a copy of the tracked pieces, after sweeping the downloaded ones.
		// Swept pieces are deselected on the engine as well
		prioritized_pieces prioritized();

		std::string const& transfer_id() const { return m_id; }

	private:

		void deselect_all();

		boost::asio::io_context& m_ioc;
		std::shared_ptr<piece_engine> m_engine;
		std::string const m_id;
		alert_manager* m_alerts;

		// serializes prioritize() calls, so the clear step of one request
		// never interleaves with the select step of another
		std::mutex m_mutex;
		prioritized_pieces m_prioritized;
	};
}

#endif // PIECESTREAM_PIECE_SCHEDULER_HPP_INCLUDED
