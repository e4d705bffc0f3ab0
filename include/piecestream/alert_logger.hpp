/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_ALERT_LOGGER_HPP_INCLUDED
#define PIECESTREAM_ALERT_LOGGER_HPP_INCLUDED

#include <cstdio>
#include <string>
#include <vector>

#include "piecestream/config.hpp"
#include "piecestream/alert.hpp"

namespace piecestream {

	class session;

	// writes alerts as lines of text to a log file, or to stderr if no file
	// is given. Only alerts in one of the categories of ``mask`` are
	// written.
	class PIECESTREAM_EXPORT alert_logger
	{
	public:
		explicit alert_logger(std::string const& log_file
			, alert_category_t mask = alert_category::all);
		~alert_logger();

		alert_logger(alert_logger const&) = delete;
		alert_logger& operator=(alert_logger const&) = delete;

		// pops every alert from the session and logs it. Returns the number
		// of lines written
		int drain(session& ses);

		void handle_alert(alert const* a);
		void handle_alerts(std::vector<alert*> const& alerts);

		bool is_open() const { return m_file != nullptr; }

	private:
		FILE* m_file;
		bool m_owns_file;
		alert_category_t m_mask;
		int m_lines = 0;
	};
}

#endif // PIECESTREAM_ALERT_LOGGER_HPP_INCLUDED
