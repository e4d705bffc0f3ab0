/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/piece_scheduler.hpp"
#include "piecestream/alert_manager.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/assert.hpp"

#include <boost/asio/post.hpp>

namespace piecestream {

	void prioritized_pieces::select(piece_index_t const first, piece_index_t const last
		, piece_priority_t const prio, time_point const now)
	{
		for (piece_index_t i = first; i <= last; ++i)
		{
			auto const it = m_pieces.find(i);
			if (it == m_pieces.end())
			{
				m_pieces.emplace(i, prioritized_piece{prio, now});
				continue;
			}
			if (it->second.priority >= prio) continue;
			it->second = prioritized_piece{prio, now};
		}
	}

	void prioritized_pieces::deselect(piece_index_t const first, piece_index_t const last
		, piece_priority_t const prio)
	{
		auto it = m_pieces.lower_bound(first);
		while (it != m_pieces.end() && it->first <= last)
		{
			if (it->second.priority == prio) it = m_pieces.erase(it);
			else ++it;
		}
	}

	piece_priority_t prioritized_pieces::priority(piece_index_t const piece) const
	{
		auto const it = m_pieces.find(piece);
		if (it == m_pieces.end()) return none_priority;
		return it->second.priority;
	}

	bool prioritized_pieces::contains(piece_index_t const piece) const
	{
		return m_pieces.count(piece) > 0;
	}

	int prioritized_pieces::remove_downloaded(piece_engine const& e
		, std::vector<std::pair<piece_index_t, piece_priority_t>>* const removed)
	{
		int num_removed = 0;
		for (auto it = m_pieces.begin(); it != m_pieces.end();)
		{
			if (is_downloaded(e, it->first))
			{
				if (removed) removed->emplace_back(it->first, it->second.priority);
				it = m_pieces.erase(it);
				++num_removed;
			}
			else
			{
				++it;
			}
		}
		return num_removed;
	}

	std::vector<std::pair<piece_index_range, piece_priority_t>> prioritized_pieces::spans() const
	{
		std::vector<std::pair<piece_index_range, piece_priority_t>> ret;
		for (auto const& p : m_pieces)
		{
			if (!ret.empty()
				&& ret.back().second == p.second.priority
				&& next(ret.back().first.last) == p.first)
			{
				ret.back().first.last = p.first;
				continue;
			}
			ret.emplace_back(piece_index_range{p.first, p.first}, p.second.priority);
		}
		return ret;
	}

	readiness_wait::readiness_wait(boost::asio::io_context& ioc
		, std::shared_ptr<piece_engine> engine
		, piece_index_range const pieces, handler h)
		: m_ioc(ioc)
		, m_engine(std::move(engine))
		, m_pieces(pieces)
		, m_handler(std::move(h))
		, m_timer(ioc)
	{}

	readiness_wait::~readiness_wait()
	{
		if (m_subscribed) m_engine->unsubscribe(m_subscription);
	}

	void readiness_wait::start(time_duration const timeout)
	{
		// subscribe before checking, so progress made in between is not
		// missed
		std::weak_ptr<readiness_wait> self = shared_from_this();
		boost::asio::io_context* ioc = &m_ioc;
		m_subscription = m_engine->subscribe([self, ioc]()
		{
			boost::asio::post(*ioc, [self]()
			{
				if (auto w = self.lock()) w->on_progress();
			});
		});
		m_subscribed = true;

		if (all_downloaded(*m_engine, m_pieces))
		{
			complete(error_code());
			return;
		}

		m_timer.expires_after(timeout);
		m_timer.async_wait([s = shared_from_this()](error_code const& ec)
			{ s->on_timeout(ec); });
	}

	void readiness_wait::cancel()
	{
		complete(boost::asio::error::operation_aborted);
	}

	void readiness_wait::fail(error_code const& ec)
	{
		complete(ec);
	}

	void readiness_wait::on_progress()
	{
		if (m_done) return;
		if (!all_downloaded(*m_engine, m_pieces)) return;
		complete(error_code());
	}

	void readiness_wait::on_timeout(error_code const& ec)
	{
		if (ec == boost::asio::error::operation_aborted) return;
		if (m_done) return;

		// the last notification may still be queued behind the timer
		if (all_downloaded(*m_engine, m_pieces))
			complete(error_code());
		else
			complete(errors::readiness_timeout);
	}

	void readiness_wait::complete(error_code const& ec)
	{
		if (m_done) return;
		m_done = true;

		m_timer.cancel();
		if (m_subscribed)
		{
			m_engine->unsubscribe(m_subscription);
			m_subscribed = false;
		}

		boost::asio::post(m_ioc, [h = std::move(m_handler), ec]()
			{ h(ec); });
		m_handler = nullptr;
	}

	piece_scheduler::piece_scheduler(boost::asio::io_context& ioc
		, std::shared_ptr<piece_engine> engine
		, std::string transfer_id
		, alert_manager* alerts)
		: m_ioc(ioc)
		, m_engine(std::move(engine))
		, m_id(std::move(transfer_id))
		, m_alerts(alerts)
	{}

	piece_index_range piece_scheduler::prioritize(byte_range const& r
		, std::int64_t const read_ahead, error_code& ec)
	{
		std::lock_guard<std::mutex> l(m_mutex);

		int const piece_length = m_engine->piece_length();
		std::int64_t const content_length = m_engine->content_length();

		piece_index_range const required = piece_range(r, piece_length, ec);
		if (ec) return {};
		piece_index_range const buffered = buffered_piece_range(r, piece_length
			, read_ahead, content_length, ec);
		if (ec) return {};

		deselect_all();

		m_engine->select(buffered.first, buffered.last, critical_priority);
		m_prioritized.select(buffered.first, buffered.last, critical_priority);

		if (m_alerts && m_alerts->should_post<pieces_prioritized_alert>())
			m_alerts->emplace_alert<pieces_prioritized_alert>(m_id, required, buffered);

		return buffered;
	}

	void piece_scheduler::deselect_all()
	{
		for (auto const& s : m_prioritized.spans())
		{
			m_engine->deselect(s.first.first, s.first.last, s.second);
			m_prioritized.deselect(s.first.first, s.first.last, s.second);
		}
		PIECESTREAM_ASSERT(m_prioritized.empty());
	}

	void piece_scheduler::clear()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		deselect_all();
	}

	prioritized_pieces piece_scheduler::prioritized()
	{
		std::lock_guard<std::mutex> l(m_mutex);

		// an untracked piece is never deselected by the next prioritize()
		std::vector<std::pair<piece_index_t, piece_priority_t>> swept;
		m_prioritized.remove_downloaded(*m_engine, &swept);
		for (auto const& p : swept) m_engine->deselect(p.first, p.first, p.second);
		return m_prioritized;
	}

	std::shared_ptr<readiness_wait> piece_scheduler::async_wait_ready(byte_range const& r
		, time_duration const timeout, readiness_wait::handler h)
	{
		error_code ec;
		piece_index_range const pieces = piece_range(r, m_engine->piece_length(), ec);

		auto const started = time_now();
		alert_manager* alerts = m_alerts;
		std::shared_ptr<piece_engine> engine = m_engine;
		auto on_done = [alerts, engine, pieces, started, timeout, id = m_id
			, h = std::move(h)](error_code const& e)
		{
			if (alerts != nullptr)
			{
				if (!e && alerts->should_post<piece_wait_alert>())
				{
					alerts->emplace_alert<piece_wait_alert>(id, pieces
						, time_now() - started);
				}
				else if (e == errors::readiness_timeout
					&& alerts->should_post<piece_wait_timeout_alert>())
				{
					alerts->emplace_alert<piece_wait_timeout_alert>(id, pieces
						, num_downloaded(*engine, pieces), timeout);
				}
			}
			h(e);
		};

		auto w = std::make_shared<readiness_wait>(m_ioc, m_engine, pieces
			, std::move(on_done));
		if (ec) w->fail(ec);
		else w->start(timeout);
		return w;
	}
}
