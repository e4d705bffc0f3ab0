/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include "piecestream/session.hpp"
#include "piecestream/aux_/session_impl.hpp"
#include "piecestream/alert_manager.hpp"

#include <boost/asio/post.hpp>

namespace piecestream {

	session::session(boost::asio::io_context& ioc, settings_pack const& pack)
		: m_impl(std::make_shared<aux::session_impl>(ioc, pack))
	{}

	session::~session()
	{
		// the io_context may not be running anymore, so this can't be posted
		m_impl->abort();
	}

	void session::apply_settings(settings_pack const& pack)
	{
		m_impl->apply_settings(pack);
	}

	settings_pack session::get_settings() const
	{
		return m_impl->get_settings();
	}

	void session::listen(error_code& ec)
	{
		m_impl->listen(ec);
	}

	boost::asio::ip::tcp::endpoint session::listen_endpoint() const
	{
		return m_impl->listen_endpoint();
	}

	void session::add_transfer(std::string const& id, piece_engine_constructor const& f
		, error_code& ec)
	{
		m_impl->add_transfer(id, f, ec);
	}

	void session::remove_transfer(std::string const& id, error_code& ec)
	{
		m_impl->remove_transfer(id, ec);
	}

	std::shared_ptr<transfer> session::find_transfer(std::string const& id) const
	{
		return m_impl->find_transfer(id);
	}

	std::vector<std::string> session::transfers() const
	{
		return m_impl->transfer_ids();
	}

	transfer_status session::status(std::string const& id, error_code& ec) const
	{
		return m_impl->status(id, ec);
	}

	void session::stop()
	{
		boost::asio::post(m_impl->get_context(), [impl = m_impl] { impl->abort(); });
	}

	void session::post_memory_usage()
	{
		m_impl->post_memory_usage();
	}

	global_memory_budget& session::memory_budget()
	{
		return m_impl->budget();
	}

	void session::pop_alerts(std::vector<alert*>* alerts)
	{
		m_impl->alerts().get_all(*alerts);
	}

	alert* session::wait_for_alert(time_duration const max_wait)
	{
		return m_impl->alerts().wait_for_alert(max_wait);
	}

	void session::set_alert_notify(std::function<void()> const& fun)
	{
		m_impl->alerts().set_notify_function(fun);
	}
}
