/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/memory_budget.hpp"
#include "piecestream/assert.hpp"

#include <vector>

namespace piecestream {

	global_memory_budget::global_memory_budget(std::int64_t const max_bytes)
		: m_max_bytes(max_bytes)
	{
		PIECESTREAM_ASSERT_PRECOND(max_bytes >= 0);
	}

	global_memory_budget::~global_memory_budget()
	{
		// every cache must be closed before the budget goes away
		PIECESTREAM_ASSERT(m_owners.empty());
	}

	owner_id_t global_memory_budget::register_owner()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		owner_id_t const id(m_next_owner++);
		m_owners.emplace(id, owner_entry{});
		return id;
	}

	void global_memory_budget::erase_chunk(owner_entry& o, piece_index_t const piece)
	{
		auto const i = o.chunks.find(piece);
		if (i == o.chunks.end()) return;

		m_lru.erase(i->second.last_used);
		o.bytes -= i->second.size;
		m_total_bytes -= i->second.size;
		--m_num_chunks;
		o.chunks.erase(i);

		PIECESTREAM_ASSERT(o.bytes >= 0);
		PIECESTREAM_ASSERT(m_total_bytes >= 0);
	}

	void global_memory_budget::evict_until_fits(std::int64_t const incoming
		, std::vector<evicted_chunk>& evicted)
	{
		while (m_total_bytes + incoming > m_max_bytes && !m_lru.empty())
		{
			auto const oldest = m_lru.begin();
			owner_id_t const owner = oldest->second.first;
			piece_index_t const piece = oldest->second.second;

			auto const o = m_owners.find(owner);
			PIECESTREAM_ASSERT(o != m_owners.end());
			auto const c = o->second.chunks.find(piece);
			PIECESTREAM_ASSERT(c != o->second.chunks.end());

			std::int64_t const size = c->second.size;
			erase_chunk(o->second, piece);
			o->second.evicted.insert(piece);

			++m_stats.evictions;
			m_stats.evicted_bytes += size;
			evicted.push_back({owner, piece, size});
		}
	}

	void global_memory_budget::notify(std::vector<evicted_chunk> const& evicted)
	{
		if (evicted.empty()) return;
		std::lock_guard<std::mutex> l(m_observer_mutex);
		if (!m_observer) return;
		for (auto const& e : evicted) m_observer(e);
	}

	void global_memory_budget::put(owner_id_t const owner, piece_index_t const piece
		, chunk_buffer data, error_code& ec)
	{
		std::int64_t const size = std::int64_t(data.size());
		std::vector<evicted_chunk> evicted;
		{
			std::lock_guard<std::mutex> l(m_mutex);

			auto const o = m_owners.find(owner);
			if (o == m_owners.end())
			{
				ec = errors::cache_closed;
				return;
			}

			if (size > m_max_bytes)
			{
				ec = errors::chunk_too_large;
				return;
			}

			// a replaced chunk does not count against the room needed for
			// the new one
			erase_chunk(o->second, piece);
			o->second.evicted.erase(piece);

			evict_until_fits(size, evicted);
			PIECESTREAM_ASSERT(m_total_bytes + size <= m_max_bytes);

			// evicting never touches the owner map itself, o is still valid
			chunk_entry e;
			e.data = std::make_shared<chunk_buffer const>(std::move(data));
			e.size = size;
			e.last_used = next_counter();
			m_lru.emplace(e.last_used, lru_key(owner, piece));
			o->second.chunks.emplace(piece, std::move(e));
			o->second.bytes += size;
			m_total_bytes += size;
			++m_num_chunks;
			++m_stats.puts;
		}
		notify(evicted);
	}

	chunk_ptr global_memory_budget::get(owner_id_t const owner
		, piece_index_t const piece, error_code& ec)
	{
		std::lock_guard<std::mutex> l(m_mutex);

		auto const o = m_owners.find(owner);
		if (o == m_owners.end())
		{
			++m_stats.misses;
			ec = errors::piece_not_found;
			return {};
		}

		auto const c = o->second.chunks.find(piece);
		if (c == o->second.chunks.end())
		{
			++m_stats.misses;
			ec = o->second.evicted.count(piece)
				? errors::piece_evicted : errors::piece_not_found;
			return {};
		}

		m_lru.erase(c->second.last_used);
		c->second.last_used = next_counter();
		m_lru.emplace(c->second.last_used, lru_key(owner, piece));
		++m_stats.hits;
		return c->second.data;
	}

	bool global_memory_budget::contains(owner_id_t const owner
		, piece_index_t const piece) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const o = m_owners.find(owner);
		return o != m_owners.end() && o->second.chunks.count(piece) > 0;
	}

	bool global_memory_budget::is_evicted(owner_id_t const owner
		, piece_index_t const piece) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const o = m_owners.find(owner);
		return o != m_owners.end() && o->second.evicted.count(piece) > 0;
	}

	void global_memory_budget::close(owner_id_t const owner)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const o = m_owners.find(owner);
		if (o == m_owners.end()) return;

		for (auto const& c : o->second.chunks)
		{
			m_lru.erase(c.second.last_used);
			m_total_bytes -= c.second.size;
			--m_num_chunks;
		}
		PIECESTREAM_ASSERT(m_total_bytes >= 0);
		m_owners.erase(o);
	}

	void global_memory_budget::set_max_bytes(std::int64_t const max_bytes)
	{
		PIECESTREAM_ASSERT_PRECOND(max_bytes >= 0);
		std::vector<evicted_chunk> evicted;
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_max_bytes = max_bytes;
			evict_until_fits(0, evicted);
		}
		notify(evicted);
	}

	std::int64_t global_memory_budget::max_bytes() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_max_bytes;
	}

	std::int64_t global_memory_budget::total_bytes() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_total_bytes;
	}

	std::int64_t global_memory_budget::owner_bytes(owner_id_t const owner) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const o = m_owners.find(owner);
		return o == m_owners.end() ? 0 : o->second.bytes;
	}

	int global_memory_budget::num_chunks() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_num_chunks;
	}

	int global_memory_budget::num_owners() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return int(m_owners.size());
	}

	budget_stats global_memory_budget::stats() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_stats;
	}

	std::optional<std::pair<owner_id_t, piece_index_t>>
	global_memory_budget::lru_chunk() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_lru.empty()) return std::nullopt;
		return m_lru.begin()->second;
	}

	void global_memory_budget::set_eviction_observer(eviction_observer o)
	{
		std::lock_guard<std::mutex> l(m_observer_mutex);
		m_observer = std::move(o);
	}
}
