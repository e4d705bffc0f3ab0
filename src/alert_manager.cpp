/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/config.hpp"
#include "piecestream/alert_manager.hpp"
#include "piecestream/alert_types.hpp"

namespace piecestream {

	alert_manager::alert_manager(int const queue_limit, alert_category_t const alert_mask)
		: m_alert_mask(alert_mask)
		, m_queue_size_limit(queue_limit)
	{}

	alert_manager::~alert_manager() = default;

	bool alert_manager::has_room(int const alert_type, int const priority)
	{
		std::size_t const limit = std::size_t(m_queue_size_limit) * std::size_t(1 + priority);
		if (m_alerts[m_generation].size() < limit) return true;
		m_dropped.set(std::size_t(alert_type));
		return false;
	}

	alert* alert_manager::wait_for_alert(time_duration const max_wait)
	{
		std::unique_lock<std::recursive_mutex> lock(m_mutex);
		auto& q = m_alerts[m_generation];
		if (q.empty()) m_condition.wait_for(lock, max_wait);

		// the wait may end early, or with the queue swapped by get_all()
		auto& cur = m_alerts[m_generation];
		return cur.empty() ? nullptr : cur.front().get();
	}

	void alert_manager::maybe_notify()
	{
		if (m_alerts[m_generation].size() != 1) return;
		if (m_notify) m_notify();
		m_condition.notify_all();
	}

	void alert_manager::set_notify_function(std::function<void()> const& fun)
	{
		std::unique_lock<std::recursive_mutex> lock(m_mutex);
		m_notify = fun;
		if (!m_alerts[m_generation].empty())
		{
			if (m_notify) m_notify();
		}
	}

	void alert_manager::get_all(std::vector<alert*>& alerts)
	{
		std::lock_guard<std::recursive_mutex> lock(m_mutex);
		alerts.clear();

		auto& q = m_alerts[m_generation];
		if (q.empty()) return;
		alerts.reserve(q.size());
		for (auto const& a : q) alerts.push_back(a.get());

		m_generation ^= 1;
		m_alerts[m_generation].clear();
	}

	bool alert_manager::pending() const
	{
		std::lock_guard<std::recursive_mutex> lock(m_mutex);
		return !m_alerts[m_generation].empty();
	}

	int alert_manager::set_alert_queue_size_limit(int const limit)
	{
		std::lock_guard<std::recursive_mutex> lock(m_mutex);
		int const old = m_queue_size_limit;
		m_queue_size_limit = limit;
		return old;
	}

	std::bitset<num_alert_types> alert_manager::dropped_alerts()
	{
		std::lock_guard<std::recursive_mutex> lock(m_mutex);
		auto const ret = m_dropped;
		m_dropped.reset();
		return ret;
	}
}
