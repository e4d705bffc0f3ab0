/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_MEMORY_PIECE_ENGINE_HPP_INCLUDED
#define PIECESTREAM_MEMORY_PIECE_ENGINE_HPP_INCLUDED

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "piecestream/config.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/time.hpp"

namespace piecestream {

	// returns the bytes of one piece. ``offset`` is the position of the
	// piece within the content and ``length`` its size.
	using piece_source = std::function<chunk_buffer(piece_index_t piece
		, std::int64_t offset, int length, error_code& ec)>;

	// a piece_source reading from a local file
	PIECESTREAM_EXPORT piece_source file_piece_source(std::string const& path
		, error_code& ec);

	// the size of a local file, or -1 on error
	PIECESTREAM_EXPORT std::int64_t file_size(std::string const& path, error_code& ec);

	// A piece engine that doesn't talk to any peers. Pieces are fetched from a
	// piece_source, one at a time on the event loop. Pieces a reader is
	// blocked on come first, then the highest priority, then the lowest
	// index. Pieces at none_priority are only fetched once a reader needs
	// them.
	//
	// Fetched pieces are put in the engine's chunk_store. When the store no
	// longer has a piece (it was evicted), the piece is missing again and is
	// fetched again.
	class PIECESTREAM_EXPORT memory_piece_engine final
		: public piece_engine
		, public std::enable_shared_from_this<memory_piece_engine>
	{
	public:

		// the content layout is not known until set_metadata() is called
		memory_piece_engine(piece_engine_params const& p, std::string name
			, piece_source src);

		memory_piece_engine(piece_engine_params const& p, std::string name
			, piece_source src, std::int64_t content_length, int piece_length);

		~memory_piece_engine() override;

		// makes the content layout known. Subscribers are notified
		void set_metadata(std::int64_t content_length, int piece_length);

		// the time between fetching two pieces. Zero fetches as fast as the
		// event loop allows
		void set_fetch_interval(time_duration d);

		// while paused, no pieces are fetched
		void pause();
		void resume();

		std::string name() const override;
		int piece_length() const override;
		std::int64_t content_length() const override;
		int num_pieces() const override;
		std::optional<piece_record> piece_status(piece_index_t piece) const override;
		void select(piece_index_t first, piece_index_t last
			, piece_priority_t prio) override;
		void deselect(piece_index_t first, piece_index_t last
			, piece_priority_t prio) override;
		std::unique_ptr<byte_reader> create_reader(byte_range const& r
			, error_code& ec) override;
		subscription_id subscribe(std::function<void()> cb) override;
		void unsubscribe(subscription_id id) override;

		// the current priority of a piece
		piece_priority_t priority(piece_index_t piece) const;

		// the number of pieces fetched from the source, including fetches
		// of evicted pieces
		int num_fetches() const;

		// the error of the last failed fetch, if any
		error_code error() const;

		// internal, used by readers
		chunk_ptr read_piece(piece_index_t piece, error_code& ec);

	private:

		enum class state_t : std::uint8_t { none, have, lost };

		void maybe_schedule_fetch();
		void on_fetch(error_code const& ec);
		piece_index_t pick_piece() const;
		bool have_piece_impl(piece_index_t piece) const;
		void notify();

		boost::asio::io_context& m_ioc;
		std::string const m_name;
		piece_source m_source;
		std::unique_ptr<chunk_store> m_store;
		boost::asio::steady_timer m_timer;

		mutable std::mutex m_mutex;

		std::int64_t m_content_length = 0;
		int m_piece_length = 0;

		std::vector<state_t> m_state;
		std::vector<piece_priority_t> m_priority;

		// pieces a reader is blocked on. They are fetched before any other
		// piece
		std::set<piece_index_t> m_wanted;

		// pieces the source failed to produce. They are not fetched again
		std::map<piece_index_t, error_code> m_failed;

		time_duration m_interval{0};
		bool m_fetch_pending = false;
		bool m_paused = false;
		int m_num_fetches = 0;
		error_code m_error;

		std::mutex m_subscriber_mutex;
		subscription_id m_next_subscription = 0;
		std::map<subscription_id, std::function<void()>> m_subscribers;
	};
}

#endif // PIECESTREAM_MEMORY_PIECE_ENGINE_HPP_INCLUDED
