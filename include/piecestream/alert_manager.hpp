/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ALERT_MANAGER_HPP_INCLUDED
#define PIECESTREAM_ALERT_MANAGER_HPP_INCLUDED

#include "piecestream/config.hpp"
#include "piecestream/alert.hpp"
#include "piecestream/alert_types.hpp" // for num_alert_types

#include <array>
#include <atomic>
#include <bitset>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <new>
#include <utility> // for std::forward
#include <vector>

namespace piecestream {

	class PIECESTREAM_EXTRA_EXPORT alert_manager
	{
	public:
		explicit alert_manager(int queue_limit
			, alert_category_t alert_mask = alert_category::error);

		alert_manager(alert_manager const&) = delete;
		alert_manager& operator=(alert_manager const&) = delete;

		~alert_manager();

		// constructs an alert of type T in the queue, unless the queue is
		// full. Alerts with a higher priority get proportionally more room
		template <class T, typename... Args>
		void emplace_alert(Args&&... args) try
		{
			std::lock_guard<std::recursive_mutex> lock(m_mutex);
			if (!has_room(T::alert_type, T::priority)) return;
			m_alerts[m_generation].push_back(
				std::make_unique<T>(std::forward<Args>(args)...));
			maybe_notify();
		}
		catch (std::bad_alloc const&)
		{
			std::lock_guard<std::recursive_mutex> lock(m_mutex);
			m_dropped.set(T::alert_type);
		}

		bool pending() const;

		// returns every queued alert. The pointers stay valid until the next
		// call to get_all()
		void get_all(std::vector<alert*>& alerts);

		template <class T>
		bool should_post() const
		{
			return m_alert_mask.load(std::memory_order_relaxed).any_of(T::static_category);
		}

		alert* wait_for_alert(time_duration max_wait);

		void set_alert_mask(alert_category_t const m) noexcept
		{
			m_alert_mask = m;
		}

		alert_category_t alert_mask() const noexcept
		{
			return m_alert_mask;
		}

		int alert_queue_size_limit() const noexcept { return m_queue_size_limit; }
		int set_alert_queue_size_limit(int queue_size_limit_);

		void set_notify_function(std::function<void()> const& fun);

		// one bit per alert type that was dropped because the queue was full
		// since the last call. The set is cleared by this call.
		std::bitset<num_alert_types> dropped_alerts();

	private:

		// must be called with m_mutex held. Marks the type as dropped when
		// there's no room
		bool has_room(int alert_type, int priority);
		void maybe_notify();

		// recursive, since the notify function runs with it held and may
		// post alerts itself
		mutable std::recursive_mutex m_mutex;
		std::condition_variable_any m_condition;
		std::atomic<alert_category_t> m_alert_mask;
		int m_queue_size_limit;

		// alert types dropped since the last call to dropped_alerts()
		std::bitset<num_alert_types> m_dropped;

		// called when the queue goes from empty to non-empty
		std::function<void()> m_notify;

		// alerts are posted to m_alerts[m_generation]. get_all() hands that
		// queue out and flips the index, releasing the alerts of the call
		// before
		int m_generation = 0;

		std::array<std::vector<std::unique_ptr<alert>>, 2> m_alerts;
	};
}

#endif // PIECESTREAM_ALERT_MANAGER_HPP_INCLUDED
