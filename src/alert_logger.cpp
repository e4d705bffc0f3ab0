/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include "piecestream/alert_logger.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/session.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <chrono>

namespace piecestream {

	alert_logger::alert_logger(std::string const& log_file, alert_category_t const mask)
		: m_file(stderr)
		, m_owns_file(false)
		, m_mask(mask)
	{
		if (log_file.empty()) return;

		m_file = std::fopen(log_file.c_str(), "a");
		if (m_file == nullptr)
		{
			std::fprintf(stderr, "failed to open log file \"%s\": (%d) %s\n"
				, log_file.c_str(), errno, std::strerror(errno));
			return;
		}
		m_owns_file = true;
	}

	alert_logger::~alert_logger()
	{
		if (m_owns_file && m_file) std::fclose(m_file);
	}

	int alert_logger::drain(session& ses)
	{
		std::vector<alert*> alerts;
		ses.pop_alerts(&alerts);
		int const before = m_lines;
		handle_alerts(alerts);
		return m_lines - before;
	}

	void alert_logger::handle_alerts(std::vector<alert*> const& alerts)
	{
		for (alert const* a : alerts) handle_alert(a);
		if (m_file) std::fflush(m_file);
	}

	void alert_logger::handle_alert(alert const* a)
	{
		if (m_file == nullptr) return;
		if (!a->category().any_of(m_mask)) return;

		using std::chrono::system_clock;
		auto const now = system_clock::now();
		std::time_t const t = system_clock::to_time_t(now);
		int const ms = int(std::chrono::duration_cast<std::chrono::milliseconds>(
			now.time_since_epoch()).count() % 1000);

		std::tm tm{};
		localtime_r(&t, &tm);
		char timestamp[64];
		std::strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm);

		// errors are easier to find when they're marked as such
		char const* prefix = "";
		if (a->category() & alert_category::error) prefix = "error ";

		std::fprintf(m_file, "[%s.%03d] %s%s: %s\n", timestamp, ms, prefix
			, a->what(), a->message().c_str());
		++m_lines;
	}
}
