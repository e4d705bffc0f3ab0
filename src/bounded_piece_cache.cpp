/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/bounded_piece_cache.hpp"

namespace piecestream {

	bounded_piece_cache::bounded_piece_cache(global_memory_budget& budget)
		: m_budget(budget)
		, m_owner(budget.register_owner())
	{}

	bounded_piece_cache::bounded_piece_cache(std::shared_ptr<global_memory_budget> budget)
		: m_budget_ref(std::move(budget))
		, m_budget(*m_budget_ref)
		, m_owner(m_budget.register_owner())
	{}

	bounded_piece_cache::~bounded_piece_cache()
	{
		close();
	}

	void bounded_piece_cache::put(piece_index_t const piece, chunk_buffer data
		, error_code& ec)
	{
		if (m_closed)
		{
			ec = errors::cache_closed;
			return;
		}
		m_budget.put(m_owner, piece, std::move(data), ec);
	}

	chunk_ptr bounded_piece_cache::get(piece_index_t const piece, error_code& ec)
	{
		if (m_closed)
		{
			ec = errors::cache_closed;
			return {};
		}
		return m_budget.get(m_owner, piece, ec);
	}

	bool bounded_piece_cache::contains(piece_index_t const piece) const
	{
		if (m_closed) return false;
		return m_budget.contains(m_owner, piece);
	}

	void bounded_piece_cache::close()
	{
		if (m_closed.exchange(true)) return;
		m_budget.close(m_owner);
	}

	std::int64_t bounded_piece_cache::resident_bytes() const
	{
		return m_budget.owner_bytes(m_owner);
	}

	chunk_store_constructor bounded_cache_constructor(global_memory_budget& budget)
	{
		return [&budget]() -> std::unique_ptr<chunk_store>
		{
			return std::make_unique<bounded_piece_cache>(budget);
		};
	}

	chunk_store_constructor bounded_cache_constructor(
		std::shared_ptr<global_memory_budget> budget)
	{
		return [budget]() -> std::unique_ptr<chunk_store>
		{
			return std::make_unique<bounded_piece_cache>(budget);
		};
	}
}
