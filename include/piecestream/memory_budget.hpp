/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_MEMORY_BUDGET_HPP_INCLUDED
#define PIECESTREAM_MEMORY_BUDGET_HPP_INCLUDED

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "piecestream/config.hpp"
#include "piecestream/units.hpp"
#include "piecestream/piece_engine.hpp" // for chunk_buffer, chunk_ptr
#include "piecestream/error_code.hpp"

namespace piecestream {

	// counters of the global_memory_budget, as returned by
	// global_memory_budget::stats()
	struct PIECESTREAM_EXPORT budget_stats
	{
		std::int64_t puts = 0;
		std::int64_t hits = 0;
		std::int64_t misses = 0;
		std::int64_t evictions = 0;
		std::int64_t evicted_bytes = 0;
	};

	// one chunk that was evicted, passed to the eviction observer
	struct PIECESTREAM_EXPORT evicted_chunk
	{
		owner_id_t owner;
		piece_index_t piece;
		std::int64_t size;
	};

	// The process-wide store of resident pieces. Every transfer's cache is an
	// owner in this store. The sum of the sizes of all resident chunks never
	// exceeds max_bytes(). When a put() would exceed it, the least recently
	// used chunks, across all owners, are evicted first.
	//
	// Recency is a counter that is incremented on every put() and get(), so
	// no two chunks ever have the same age.
	//
	// All member functions are thread safe. One mutex guards both the
	// accounting and the chunk data, which makes check-evict-insert a single
	// atomic step.
	class PIECESTREAM_EXPORT global_memory_budget
	{
	public:
		explicit global_memory_budget(std::int64_t max_bytes);
		~global_memory_budget();

		global_memory_budget(global_memory_budget const&) = delete;
		global_memory_budget& operator=(global_memory_budget const&) = delete;

		// allocates a new owner id. Chunks can only be put for registered
		// owners
		owner_id_t register_owner();

		// stores ``data`` as the chunk for ``piece``, replacing any previous
		// chunk for it and clearing its evicted state. Fails with
		// cache_closed if the owner is not registered and chunk_too_large
		// if the chunk cannot fit even in an empty budget.
		void put(owner_id_t owner, piece_index_t piece, chunk_buffer data
			, error_code& ec);

		// returns the chunk and marks it as the most recently used. Fails
		// with piece_evicted if the chunk was discarded under memory
		// pressure and piece_not_found if it was never stored.
		chunk_ptr get(owner_id_t owner, piece_index_t piece, error_code& ec);

		bool contains(owner_id_t owner, piece_index_t piece) const;
		bool is_evicted(owner_id_t owner, piece_index_t piece) const;

		// drops every chunk of the owner and unregisters it. Closing an
		// owner that is not registered is a no-op
		void close(owner_id_t owner);

		// changing the limit evicts immediately if the resident chunks no
		// longer fit
		void set_max_bytes(std::int64_t max_bytes);

		std::int64_t max_bytes() const;
		std::int64_t total_bytes() const;
		std::int64_t owner_bytes(owner_id_t owner) const;
		int num_chunks() const;
		int num_owners() const;
		budget_stats stats() const;

		// the chunk that would be evicted next, if any
		std::optional<std::pair<owner_id_t, piece_index_t>> lru_chunk() const;

		// the observer is called for every eviction, after the budget's
		// mutex has been released
		using eviction_observer = std::function<void(evicted_chunk const&)>;
		void set_eviction_observer(eviction_observer o);

	private:

		struct chunk_entry
		{
			chunk_ptr data;
			std::int64_t size = 0;
			std::uint64_t last_used = 0;
		};

		struct owner_entry
		{
			std::unordered_map<piece_index_t, chunk_entry> chunks;
			std::set<piece_index_t> evicted;
			std::int64_t bytes = 0;
		};

		using lru_key = std::pair<owner_id_t, piece_index_t>;

		// all of these require m_mutex to be held
		std::uint64_t next_counter() { return ++m_counter; }
		void evict_until_fits(std::int64_t incoming, std::vector<evicted_chunk>& evicted);
		void erase_chunk(owner_entry& o, piece_index_t piece);
		void notify(std::vector<evicted_chunk> const& evicted);

		mutable std::mutex m_mutex;

		std::int64_t m_max_bytes;
		std::int64_t m_total_bytes = 0;
		int m_num_chunks = 0;

		// the global recency counter. The key of every resident chunk in
		// m_lru is a unique value of this counter
		std::uint64_t m_counter = 0;

		std::uint32_t m_next_owner = 0;

		std::unordered_map<owner_id_t, owner_entry> m_owners;

		// resident chunks ordered by last use, oldest first
		std::map<std::uint64_t, lru_key> m_lru;

		budget_stats m_stats;

		// m_observer is only invoked without m_mutex held. It's guarded by
		// its own mutex so it can be replaced while evictions are reported
		mutable std::mutex m_observer_mutex;
		eviction_observer m_observer;
	};
}

#endif // PIECESTREAM_MEMORY_BUDGET_HPP_INCLUDED
