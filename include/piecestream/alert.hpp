/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ALERT_HPP_INCLUDED
#define PIECESTREAM_ALERT_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <type_traits>

#include "piecestream/config.hpp"
#include "piecestream/flags.hpp"
#include "piecestream/time.hpp"

// The piecestream library never writes log output itself. Everything worth
// reporting, from errors to per-request tracing, is posted as an alert to
// the session's alert queue. Which alerts are posted is controlled by the
// alert mask, a combination of the alert_category_t flags below.
//
// Alerts are retrieved with session::pop_alerts(). The alert objects are
// owned by the session and stay valid until the next call to pop_alerts().

namespace piecestream {

struct alert_category_tag;
using alert_category_t = flags::bitfield_flag<std::uint32_t, alert_category_tag>;

namespace alert_category {

	// Enables alerts that report an error. This includes listen sockets that
	// fail and requests that could not be served.
	constexpr alert_category_t error = 0_bit;

	// Enables alerts for state changes of the session, such as transfers
	// being added or removed and the listen socket opening.
	constexpr alert_category_t status = 1_bit;

	// Enables alerts about the memory budget, such as chunks being evicted.
	constexpr alert_category_t storage = 2_bit;

	// Alerts when something is slower than it should be, e.g. pieces that
	// were not downloaded before a stream had to start.
	constexpr alert_category_t performance_warning = 3_bit;

	// Enables alerts for the life cycle of stream responses.
	constexpr alert_category_t stream = 4_bit;

	// Free-form debug messages from the session.
	constexpr alert_category_t session_log = 5_bit;

	// Free-form debug messages for individual transfers.
	constexpr alert_category_t transfer_log = 6_bit;

	// Every HTTP request received by the server.
	constexpr alert_category_t incoming_request = 7_bit;

	// Changes to the piece priorities of transfers.
	constexpr alert_category_t piece_progress = 8_bit;

	// The full bitmask, representing all available categories.
	constexpr alert_category_t all = alert_category_t::all();

} // namespace alert_category

	// The ``alert`` class is the base class that specific messages are
	// derived from.
	class PIECESTREAM_EXPORT alert
	{
	public:

		// hidden
		alert();
		// hidden
		alert(alert const& rhs) = delete;
		alert& operator=(alert const&) = delete;
		// hidden
		virtual ~alert();

		// a timestamp is automatically created in the constructor
		time_point timestamp() const;

		// returns an integer that is unique to this alert type. It can be
		// compared against the static ``alert_type`` constant of a concrete
		// alert to find out which type it is.
		virtual int type() const noexcept = 0;

		// returns a string literal naming the type of the alert
		virtual char const* what() const noexcept = 0;

		// a human readable description of the alert and the information
		// bundled with it, for logging
		virtual std::string message() const = 0;

		// the categories this alert belongs to
		virtual alert_category_t category() const noexcept = 0;

	private:
		time_point const m_timestamp;
	};

	// casts the alert to the concrete type T, if it is of that type.
	// Returns nullptr otherwise.
	template <class T> T* alert_cast(alert* a)
	{
		static_assert(std::is_base_of<alert, T>::value
			, "alert_cast<> can only be used with alert types (deriving from alert)");

		if (a == nullptr) return nullptr;
		if (a->type() == T::alert_type) return static_cast<T*>(a);
		return nullptr;
	}
	template <class T> T const* alert_cast(alert const* a)
	{
		static_assert(std::is_base_of<alert, T>::value
			, "alert_cast<> can only be used with alert types (deriving from alert)");
		if (a == nullptr) return nullptr;
		if (a->type() == T::alert_type) return static_cast<T const*>(a);
		return nullptr;
	}

} // namespace piecestream

#endif // PIECESTREAM_ALERT_HPP_INCLUDED
