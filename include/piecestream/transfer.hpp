/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_TRANSFER_HPP_INCLUDED
#define PIECESTREAM_TRANSFER_HPP_INCLUDED

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "piecestream/config.hpp"
#include "piecestream/units.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/piece_scheduler.hpp"

namespace piecestream {

	class alert_manager;

	// the state of one transfer, as reported by session::status()
	struct PIECESTREAM_EXPORT transfer_status
	{
		std::string id;
		std::string name;
		std::int64_t content_length = 0;
		int piece_length = 0;
		int num_pieces = 0;
		int num_downloaded = 0;

		// runs of consecutive downloaded pieces
		std::vector<piece_index_range> downloaded;

		// the pieces currently selected by stream requests
		std::vector<std::pair<piece_index_range, piece_priority_t>> prioritized;

		// the number of bytes of this transfer resident in the memory budget
		std::int64_t cache_bytes = 0;

		// the number of stream responses in flight
		int active_streams = 0;
	};

	// one piece engine registered with the session, and the scheduler that
	// prioritizes its pieces for stream requests
	class PIECESTREAM_EXPORT transfer
	{
	public:
		transfer(boost::asio::io_context& ioc, std::string id
			, std::shared_ptr<piece_engine> engine, alert_manager* alerts);

		transfer(transfer const&) = delete;
		transfer& operator=(transfer const&) = delete;

		std::string const& id() const { return m_id; }
		std::string name() const { return m_engine->name(); }

		piece_engine& engine() { return *m_engine; }
		piece_engine const& engine() const { return *m_engine; }
		std::shared_ptr<piece_engine> const& engine_ptr() const { return m_engine; }
		piece_scheduler& scheduler() { return m_scheduler; }

		// the owner ids of the chunk stores the engine created. Normally
		// there's exactly one
		void add_owner(owner_id_t o);
		std::vector<owner_id_t> owners() const;

		void stream_started() { ++m_active_streams; }
		void stream_finished() { --m_active_streams; }
		int active_streams() const { return m_active_streams; }

		// deselects everything stream requests have selected
		void abort();

	private:
		std::string const m_id;
		std::shared_ptr<piece_engine> m_engine;
		piece_scheduler m_scheduler;

		mutable std::mutex m_mutex;
		std::vector<owner_id_t> m_owners;

		std::atomic<int> m_active_streams{0};
	};
}

#endif // PIECESTREAM_TRANSFER_HPP_INCLUDED
