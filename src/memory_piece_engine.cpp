/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/memory_piece_engine.hpp"
#include "piecestream/assert.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

#include <boost/asio/post.hpp>

namespace piecestream {

namespace {

	struct memory_reader_state : std::enable_shared_from_this<memory_reader_state>
	{
		memory_reader_state(boost::asio::io_context& ioc
			, std::weak_ptr<memory_piece_engine> e, byte_range const& r)
			: m_ioc(ioc), m_engine(std::move(e)), m_range(r), m_pos(r.start)
		{}

		void async_read(boost::asio::mutable_buffer const buf, byte_reader::read_handler h)
		{
			PIECESTREAM_ASSERT(!m_handler);
			m_buffer = buf;
			m_handler = std::move(h);
			boost::asio::post(m_ioc, [self = shared_from_this()] { self->try_read(); });
		}

		void close()
		{
			if (m_closed) return;
			m_closed = true;
			unsubscribe();
			if (m_handler) complete(boost::asio::error::operation_aborted, 0);
		}

		void try_read()
		{
			if (!m_handler) return;
			if (m_closed)
			{
				complete(boost::asio::error::operation_aborted, 0);
				return;
			}

			std::shared_ptr<memory_piece_engine> e = m_engine.lock();
			if (!e)
			{
				complete(boost::asio::error::operation_aborted, 0);
				return;
			}

			if (m_pos > m_range.end)
			{
				complete(boost::asio::error::eof, 0);
				return;
			}

			int const piece_length = e->piece_length();
			piece_index_t const piece(static_cast<std::int32_t>(m_pos / piece_length));

			error_code ec;
			chunk_ptr const chunk = e->read_piece(piece, ec);
			if (ec == errors::piece_evicted || ec == errors::piece_not_found)
			{
				// the engine is fetching the piece. Try again when it makes
				// progress
				subscribe(*e);
				return;
			}
			if (ec)
			{
				complete(ec, 0);
				return;
			}

			// the rest of the range, as far as it lies within this piece
			byte_range const part = bytes_in_piece(piece
				, byte_range(m_pos, m_range.end), piece_length, ec);
			if (ec || std::int64_t(chunk->size()) <= part.end)
			{
				complete(errors::piece_not_found, 0);
				return;
			}

			std::int64_t const offset = part.start;
			std::size_t const n = std::size_t(std::min(
				std::int64_t(m_buffer.size()), part.size()));
			std::memcpy(m_buffer.data(), chunk->data() + offset, n);
			m_pos += std::int64_t(n);
			complete(error_code(), n);
		}

		void subscribe(memory_piece_engine& e)
		{
			if (m_subscribed) return;
			std::weak_ptr<memory_reader_state> self = shared_from_this();
			boost::asio::io_context* ioc = &m_ioc;
			m_subscription = e.subscribe([self, ioc]
			{
				boost::asio::post(*ioc, [self]
				{
					if (auto s = self.lock()) s->try_read();
				});
			});
			m_subscribed = true;
		}

		void unsubscribe()
		{
			if (!m_subscribed) return;
			m_subscribed = false;
			if (auto e = m_engine.lock()) e->unsubscribe(m_subscription);
		}

		void complete(error_code const& ec, std::size_t const n)
		{
			boost::asio::post(m_ioc, [h = std::move(m_handler), ec, n] { h(ec, n); });
			m_handler = nullptr;
		}

		boost::asio::io_context& m_ioc;
		std::weak_ptr<memory_piece_engine> m_engine;
		byte_range const m_range;

		// the offset of the next byte to read
		std::int64_t m_pos;

		boost::asio::mutable_buffer m_buffer;
		byte_reader::read_handler m_handler;
		subscription_id m_subscription = 0;
		bool m_subscribed = false;
		bool m_closed = false;
	};

	struct memory_reader final : byte_reader
	{
		explicit memory_reader(std::shared_ptr<memory_reader_state> s)
			: m_state(std::move(s)) {}
		~memory_reader() override { m_state->close(); }

		void async_read(boost::asio::mutable_buffer const buf, read_handler h) override
		{ m_state->async_read(buf, std::move(h)); }

		void close() override { m_state->close(); }

	private:
		std::shared_ptr<memory_reader_state> m_state;
	};

	piece_index_t const no_piece{-1};
}

	std::int64_t file_size(std::string const& path, error_code& ec)
	{
		struct stat st;
		if (::stat(path.c_str(), &st) < 0)
		{
			ec.assign(errno, boost::system::generic_category());
			return -1;
		}
		return std::int64_t(st.st_size);
	}

	piece_source file_piece_source(std::string const& path, error_code& ec)
	{
		std::shared_ptr<FILE> f(std::fopen(path.c_str(), "rb")
			, [](FILE* p) { if (p != nullptr) std::fclose(p); });
		if (!f)
		{
			ec.assign(errno, boost::system::generic_category());
			return {};
		}

		auto m = std::make_shared<std::mutex>();
		return [f, m](piece_index_t, std::int64_t const offset, int const length
			, error_code& e)
		{
			chunk_buffer buf(static_cast<std::size_t>(length));
			std::lock_guard<std::mutex> l(*m);
			if (::fseeko(f.get(), off_t(offset), SEEK_SET) != 0)
			{
				e.assign(errno, boost::system::generic_category());
				return chunk_buffer();
			}
			std::size_t const r = std::fread(buf.data(), 1, buf.size(), f.get());
			if (r != buf.size())
			{
				if (std::ferror(f.get())) e.assign(errno, boost::system::generic_category());
				else e = boost::asio::error::eof;
				return chunk_buffer();
			}
			return buf;
		};
	}

	memory_piece_engine::memory_piece_engine(piece_engine_params const& p
		, std::string name, piece_source src)
		: m_ioc(p.io_context)
		, m_name(std::move(name))
		, m_source(std::move(src))
		, m_store(p.storage())
		, m_timer(p.io_context)
	{}

	memory_piece_engine::memory_piece_engine(piece_engine_params const& p
		, std::string name, piece_source src
		, std::int64_t const content_length, int const piece_length)
		: memory_piece_engine(p, std::move(name), std::move(src))
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_content_length = content_length;
		m_piece_length = piece_length;
		int const n = ps::num_pieces(content_length, piece_length);
		m_state.assign(std::size_t(n), state_t::none);
		m_priority.assign(std::size_t(n), none_priority);
	}

	memory_piece_engine::~memory_piece_engine()
	{
		m_timer.cancel();
		if (m_store) m_store->close();
	}

	void memory_piece_engine::set_metadata(std::int64_t const content_length
		, int const piece_length)
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_content_length = content_length;
			m_piece_length = piece_length;
			int const n = ps::num_pieces(content_length, piece_length);
			m_state.assign(std::size_t(n), state_t::none);
			m_priority.assign(std::size_t(n), none_priority);
		}
		notify();
	}

	void memory_piece_engine::set_fetch_interval(time_duration const d)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_interval = d;
	}

	void memory_piece_engine::pause()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_paused = true;
	}

	void memory_piece_engine::resume()
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_paused = false;
		}
		maybe_schedule_fetch();
	}

	std::string memory_piece_engine::name() const { return m_name; }

	int memory_piece_engine::piece_length() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_piece_length;
	}

	std::int64_t memory_piece_engine::content_length() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_content_length;
	}

	int memory_piece_engine::num_pieces() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return int(m_state.size());
	}

	std::optional<piece_record> memory_piece_engine::piece_status(piece_index_t const piece) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		int const idx = static_cast<int>(piece);
		if (idx < 0 || idx >= int(m_state.size())) return std::nullopt;
		if (m_state[std::size_t(idx)] == state_t::none) return std::nullopt;

		piece_record ret;
		ret.index = piece;
		ret.length = ps::piece_size(piece, m_content_length, m_piece_length);
		ret.missing = have_piece_impl(piece) ? 0 : ret.length;
		return ret;
	}

	bool memory_piece_engine::have_piece_impl(piece_index_t const piece) const
	{
		return m_state[std::size_t(static_cast<int>(piece))] == state_t::have
			&& m_store->contains(piece);
	}

	piece_priority_t memory_piece_engine::priority(piece_index_t const piece) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		int const idx = static_cast<int>(piece);
		if (idx < 0 || idx >= int(m_priority.size())) return none_priority;
		return m_priority[std::size_t(idx)];
	}

	void memory_piece_engine::select(piece_index_t const first, piece_index_t const last
		, piece_priority_t const prio)
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			int const end = std::min(static_cast<int>(last) + 1, int(m_priority.size()));
			for (int i = std::max(static_cast<int>(first), 0); i < end; ++i)
				m_priority[std::size_t(i)] = prio;
		}
		maybe_schedule_fetch();
	}

	void memory_piece_engine::deselect(piece_index_t const first, piece_index_t const last
		, piece_priority_t const prio)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		int const end = std::min(static_cast<int>(last) + 1, int(m_priority.size()));
		for (int i = std::max(static_cast<int>(first), 0); i < end; ++i)
		{
			if (m_priority[std::size_t(i)] == prio)
				m_priority[std::size_t(i)] = none_priority;
		}
	}

	std::unique_ptr<byte_reader> memory_piece_engine::create_reader(byte_range const& r
		, error_code& ec)
	{
		std::int64_t const len = content_length();
		if (len <= 0 || piece_length() <= 0)
		{
			ec = errors::metadata_not_ready;
			return {};
		}
		if (!r.valid_for(len))
		{
			ec = errors::range_not_satisfiable;
			return {};
		}
		auto s = std::make_shared<memory_reader_state>(m_ioc, weak_from_this(), r);
		return std::make_unique<memory_reader>(std::move(s));
	}

	subscription_id memory_piece_engine::subscribe(std::function<void()> cb)
	{
		std::lock_guard<std::mutex> l(m_subscriber_mutex);
		subscription_id const id = ++m_next_subscription;
		m_subscribers.emplace(id, std::move(cb));
		return id;
	}

	void memory_piece_engine::unsubscribe(subscription_id const id)
	{
		std::lock_guard<std::mutex> l(m_subscriber_mutex);
		m_subscribers.erase(id);
	}

	int memory_piece_engine::num_fetches() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_num_fetches;
	}

	error_code memory_piece_engine::error() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_error;
	}

	chunk_ptr memory_piece_engine::read_piece(piece_index_t const piece, error_code& ec)
	{
		chunk_ptr ret = m_store->get(piece, ec);
		if (!ec) return ret;
		if (ec != errors::piece_evicted && ec != errors::piece_not_found) return ret;

		{
			std::lock_guard<std::mutex> l(m_mutex);
			int const idx = static_cast<int>(piece);
			if (idx < 0 || idx >= int(m_state.size()))
			{
				ec = errors::invalid_piece_index;
				return {};
			}
			auto const failed = m_failed.find(piece);
			if (failed != m_failed.end())
			{
				ec = failed->second;
				return {};
			}
			if (m_state[std::size_t(idx)] == state_t::have)
				m_state[std::size_t(idx)] = state_t::lost;
			m_wanted.insert(piece);
		}
		maybe_schedule_fetch();
		return ret;
	}

	piece_index_t memory_piece_engine::pick_piece() const
	{
		for (piece_index_t const p : m_wanted)
		{
			if (m_failed.count(p)) continue;
			if (!have_piece_impl(p)) return p;
		}

		piece_index_t best = no_piece;
		piece_priority_t best_prio = none_priority;
		for (int i = 0; i < int(m_state.size()); ++i)
		{
			piece_priority_t const prio = m_priority[std::size_t(i)];
			if (prio <= best_prio) continue;

			piece_index_t const p(i);
			if (have_piece_impl(p)) continue;
			if (m_failed.count(p)) continue;
			best = p;
			best_prio = prio;
		}
		return best;
	}

	void memory_piece_engine::maybe_schedule_fetch()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_fetch_pending || m_paused || m_piece_length <= 0) return;
		if (pick_piece() == no_piece) return;

		m_fetch_pending = true;
		m_timer.expires_after(m_interval);
		m_timer.async_wait([self = weak_from_this()](error_code const& ec)
		{
			if (auto e = self.lock()) e->on_fetch(ec);
		});
	}

	void memory_piece_engine::on_fetch(error_code const& e)
	{
		piece_index_t piece = no_piece;
		std::int64_t offset = 0;
		int length = 0;
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_fetch_pending = false;
			if (e == boost::asio::error::operation_aborted) return;
			if (m_paused) return;
			piece = pick_piece();
			if (piece == no_piece) return;
			offset = piece_offset(piece, m_piece_length);
			length = ps::piece_size(piece, m_content_length, m_piece_length);
		}

		error_code ec;
		chunk_buffer data = m_source(piece, offset, length, ec);
		if (!ec && int(data.size()) != length) ec = boost::asio::error::eof;
		if (!ec) m_store->put(piece, std::move(data), ec);

		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_wanted.erase(piece);
			if (ec)
			{
				m_error = ec;
				m_failed[piece] = ec;
			}
			else
			{
				m_state[std::size_t(static_cast<int>(piece))] = state_t::have;
				++m_num_fetches;
			}
		}

		notify();
		maybe_schedule_fetch();
	}

	void memory_piece_engine::notify()
	{
		std::vector<std::function<void()>> subscribers;
		{
			std::lock_guard<std::mutex> l(m_subscriber_mutex);
			subscribers.reserve(m_subscribers.size());
			for (auto const& s : m_subscribers) subscribers.push_back(s.second);
		}
		for (auto const& cb : subscribers) cb();
	}
}
