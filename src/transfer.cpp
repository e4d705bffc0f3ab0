/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/transfer.hpp"

namespace piecestream {

	transfer::transfer(boost::asio::io_context& ioc, std::string id
		, std::shared_ptr<piece_engine> engine, alert_manager* alerts)
		: m_id(std::move(id))
		, m_engine(std::move(engine))
		, m_scheduler(ioc, m_engine, m_id, alerts)
	{}

	void transfer::add_owner(owner_id_t const o)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_owners.push_back(o);
	}

	std::vector<owner_id_t> transfer::owners() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_owners;
	}

	void transfer::abort()
	{
		m_scheduler.clear();
	}
}
