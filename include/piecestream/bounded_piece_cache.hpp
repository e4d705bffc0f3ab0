/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_BOUNDED_PIECE_CACHE_HPP_INCLUDED
#define PIECESTREAM_BOUNDED_PIECE_CACHE_HPP_INCLUDED

#include <atomic>
#include <memory>

#include "piecestream/config.hpp"
#include "piecestream/piece_engine.hpp"
#include "piecestream/memory_budget.hpp"

namespace piecestream {

	// the chunk_store of one transfer. Its chunks live in the shared
	// global_memory_budget and count against its limit. A piece that was
	// evicted to make room for other pieces (of any transfer) is reported as
	// errors::piece_evicted, never as stale data.
	//
	// The cache is closed when it's destructed, releasing all of its memory.
	class PIECESTREAM_EXPORT bounded_piece_cache final : public chunk_store
	{
	public:
		explicit bounded_piece_cache(global_memory_budget& budget);

		// the cache shares ownership of the budget, which is then guaranteed
		// to outlive it
		explicit bounded_piece_cache(std::shared_ptr<global_memory_budget> budget);
		~bounded_piece_cache() override;

		bounded_piece_cache(bounded_piece_cache const&) = delete;
		bounded_piece_cache& operator=(bounded_piece_cache const&) = delete;

		void put(piece_index_t piece, chunk_buffer data, error_code& ec) override;
		chunk_ptr get(piece_index_t piece, error_code& ec) override;
		bool contains(piece_index_t piece) const override;
		void close() override;

		owner_id_t owner() const { return m_owner; }
		bool is_closed() const { return m_closed; }

		// the number of bytes this cache currently holds
		std::int64_t resident_bytes() const;

	private:
		std::shared_ptr<global_memory_budget> m_budget_ref;
		global_memory_budget& m_budget;
		owner_id_t const m_owner;
		std::atomic<bool> m_closed{false};
	};

	// returns a constructor for chunk stores backed by ``budget``. The budget
	// must outlive every store created by it.
	PIECESTREAM_EXPORT chunk_store_constructor bounded_cache_constructor(
		global_memory_budget& budget);
	PIECESTREAM_EXPORT chunk_store_constructor bounded_cache_constructor(
		std::shared_ptr<global_memory_budget> budget);
}

#endif // PIECESTREAM_BOUNDED_PIECE_CACHE_HPP_INCLUDED
