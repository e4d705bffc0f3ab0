/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "test.hpp"
#include "fake_piece_engine.hpp" // for content_byte
#include "piecestream/memory_piece_engine.hpp"
#include "piecestream/memory_budget.hpp"
#include "piecestream/bounded_piece_cache.hpp"

using namespace piecestream;

namespace {

piece_index_t piece(int i) { return piece_index_t(i); }

// produces content_byte() for every piece and logs the order pieces are
// asked for in. Pieces in ``fail`` fail with io_error
struct logging_source
{
	std::shared_ptr<std::vector<int>> log = std::make_shared<std::vector<int>>();
	std::shared_ptr<std::vector<int>> fail = std::make_shared<std::vector<int>>();

	piece_source source() const
	{
		auto l = log;
		auto f = fail;
		return [l, f](piece_index_t const p, std::int64_t const offset, int const length
			, error_code& ec)
		{
			int const idx = static_cast<int>(p);
			l->push_back(idx);
			if (std::find(f->begin(), f->end(), idx) != f->end())
			{
				ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
				return chunk_buffer();
			}
			chunk_buffer ret(static_cast<std::size_t>(length));
			for (int i = 0; i < length; ++i) ret[std::size_t(i)] = content_byte(offset + i);
			return ret;
		};
	}

	int count(int const p) const
	{ return int(std::count(log->begin(), log->end(), p)); }
};

// reads a byte_range to its end, or until the reader fails. The handlers
// keep the operation alive, so it's safe to leave it unfinished while the
// io_context isn't running
struct read_op : std::enable_shared_from_this<read_op>
{
	explicit read_op(std::int64_t const s) : size(s) {}

	std::int64_t const size;
	std::unique_ptr<byte_reader> reader;
	std::vector<char> buffer = std::vector<char>(700);
	std::string data;
	error_code ec;
	bool done = false;

	void next()
	{
		if (std::int64_t(data.size()) == size)
		{
			done = true;
			return;
		}
		reader->async_read(boost::asio::buffer(buffer)
			, [self = shared_from_this()](error_code const& e, std::size_t const n)
			{
				if (e)
				{
					self->ec = e;
					self->done = true;
					return;
				}
				self->data.append(self->buffer.data(), n);
				self->next();
			});
	}
};

std::shared_ptr<read_op> start_read(memory_piece_engine& e, byte_range const& r)
{
	auto op = std::make_shared<read_op>(r.size());
	op->reader = e.create_reader(r, op->ec);
	if (op->ec)
	{
		op->done = true;
		return op;
	}
	op->next();
	return op;
}

bool matches(std::string const& data, std::int64_t const offset)
{
	for (std::size_t i = 0; i < data.size(); ++i)
		if (data[i] != content_byte(offset + std::int64_t(i))) return false;
	return true;
}

void run(boost::asio::io_context& ioc)
{
	ioc.restart();
	ioc.run();
}

std::string temp_name(char const* suffix)
{
	return "test_engine_" + std::to_string(unit_test::test_counter()) + suffix;
}

void write_content(std::string const& name, int const size)
{
	FILE* f = std::fopen(name.c_str(), "wb");
	TEST_CHECK(f != nullptr);
	if (f == nullptr) return;
	for (int i = 0; i < size; ++i) std::fputc(content_byte(i), f);
	std::fclose(f);
}

} // anonymous namespace

PIECESTREAM_TEST(fetch_order_follows_priority)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	logging_source src;
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source(), 10 * 1024, 1024);

	e->pause();
	e->select(piece(5), piece(5), low_priority);
	e->select(piece(8), piece(8), critical_priority);
	e->select(piece(2), piece(2), critical_priority);
	e->select(piece(0), piece(0), normal_priority);
	run(ioc);
	TEST_CHECK(src.log->empty());

	e->resume();
	run(ioc);

	// highest priority first, ties broken by the lower index. Pieces nobody
	// selected or asked for are not fetched
	TEST_EQUAL(int(src.log->size()), 4);
	TEST_EQUAL((*src.log)[0], 2);
	TEST_EQUAL((*src.log)[1], 8);
	TEST_EQUAL((*src.log)[2], 0);
	TEST_EQUAL((*src.log)[3], 5);
	TEST_EQUAL(e->num_fetches(), 4);
	TEST_CHECK(is_downloaded(*e, piece(8)));
	TEST_CHECK(!is_downloaded(*e, piece(9)));

	e->deselect(piece(8), piece(8), critical_priority);
	TEST_EQUAL(e->priority(piece(8)), none_priority);
	// a deselect at another priority leaves the piece alone
	e->deselect(piece(2), piece(2), low_priority);
	TEST_EQUAL(e->priority(piece(2)), critical_priority);
}

PIECESTREAM_TEST(blocked_reader_comes_first)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	logging_source src;
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source(), 10 * 1024, 1024);

	e->pause();
	e->select(piece(0), piece(3), critical_priority);
	auto op = start_read(*e, byte_range(9 * 1024 + 10, 9 * 1024 + 99));
	run(ioc);
	TEST_CHECK(!op->done);

	e->resume();
	run(ioc);
	TEST_CHECK(op->done);
	TEST_CHECK(!op->ec);
	TEST_EQUAL(int(op->data.size()), 90);
	TEST_CHECK(matches(op->data, 9 * 1024 + 10));

	TEST_EQUAL(int(src.log->size()), 5);
	TEST_EQUAL(src.log->front(), 9);
}

PIECESTREAM_TEST(paused_engine_fetches_nothing)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	logging_source src;
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source(), 4 * 1024, 1024);

	e->pause();
	auto op = start_read(*e, byte_range(0, 2047));
	run(ioc);
	TEST_CHECK(!op->done);
	TEST_EQUAL(e->num_fetches(), 0);

	e->resume();
	run(ioc);
	TEST_CHECK(op->done);
	TEST_EQUAL(int(op->data.size()), 2048);
	TEST_CHECK(matches(op->data, 0));
	TEST_EQUAL(e->num_fetches(), 2);
}

// a piece dropped from the cache is fetched again when read, and the
// reader gets the same bytes as the first time
PIECESTREAM_TEST(evicted_piece_is_fetched_again)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(2 * 1024);
	logging_source src;
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source(), 4 * 1024, 1024);

	auto op = start_read(*e, byte_range(0, 4 * 1024 - 1));
	run(ioc);
	TEST_CHECK(op->done);
	TEST_CHECK(!op->ec);
	TEST_EQUAL(int(op->data.size()), 4 * 1024);
	TEST_CHECK(matches(op->data, 0));
	TEST_EQUAL(e->num_fetches(), 4);

	// only the last two pieces fit
	TEST_CHECK(budget.total_bytes() <= 2 * 1024);
	TEST_EQUAL(budget.stats().evictions, 2);
	TEST_CHECK(!is_downloaded(*e, piece(0)));
	TEST_CHECK(is_downloaded(*e, piece(3)));

	error_code ec;
	e->read_piece(piece(0), ec);
	TEST_EQUAL(ec, error_code(errors::piece_evicted));
	run(ioc);
	TEST_EQUAL(src.count(0), 2);
	TEST_CHECK(is_downloaded(*e, piece(0)));

	auto again = start_read(*e, byte_range(100, 1023));
	run(ioc);
	TEST_CHECK(again->done);
	TEST_CHECK(!again->ec);
	TEST_EQUAL(again->data, op->data.substr(100, 924));
	TEST_EQUAL(src.count(0), 2);
}

// a piece the source can't produce is not asked for again. Readers get the
// source's error
PIECESTREAM_TEST(failed_fetch_is_remembered)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	logging_source src;
	src.fail->push_back(2);
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source(), 4 * 1024, 1024);

	error_code const io_error = boost::system::errc::make_error_code(
		boost::system::errc::io_error);

	auto op = start_read(*e, byte_range(1024, 4 * 1024 - 1));
	run(ioc);
	TEST_CHECK(op->done);
	TEST_EQUAL(op->ec, io_error);
	TEST_EQUAL(int(op->data.size()), 1024);
	TEST_CHECK(matches(op->data, 1024));
	TEST_EQUAL(e->error(), io_error);

	auto again = start_read(*e, byte_range(2048, 2100));
	run(ioc);
	TEST_CHECK(again->done);
	TEST_EQUAL(again->ec, io_error);
	TEST_CHECK(again->data.empty());
	TEST_EQUAL(src.count(2), 1);

	// a selected failed piece isn't retried either
	e->select(piece(2), piece(3), critical_priority);
	run(ioc);
	TEST_EQUAL(src.count(2), 1);
	TEST_EQUAL(src.count(3), 1);
}

PIECESTREAM_TEST(metadata_arrives_later)
{
	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	logging_source src;
	auto e = std::make_shared<memory_piece_engine>(
		piece_engine_params(ioc, bounded_cache_constructor(budget))
		, "movie.mp4", src.source());

	TEST_EQUAL(e->content_length(), 0);
	TEST_EQUAL(e->num_pieces(), 0);
	error_code ec;
	TEST_CHECK(!e->create_reader(byte_range(0, 10), ec));
	TEST_EQUAL(ec, error_code(errors::metadata_not_ready));

	int notified = 0;
	subscription_id const id = e->subscribe([&] { ++notified; });
	e->set_metadata(3000, 1024);
	e->unsubscribe(id);
	TEST_EQUAL(notified, 1);
	TEST_EQUAL(e->num_pieces(), 3);

	ec.clear();
	TEST_CHECK(!e->create_reader(byte_range(2000, 3000), ec));
	TEST_EQUAL(ec, error_code(errors::range_not_satisfiable));

	auto op = start_read(*e, byte_range(2000, 2999));
	run(ioc);
	TEST_CHECK(op->done);
	TEST_CHECK(!op->ec);
	TEST_EQUAL(int(op->data.size()), 1000);
	TEST_CHECK(matches(op->data, 2000));
}

PIECESTREAM_TEST(file_source)
{
	std::string const name = temp_name(".bin");
	write_content(name, 3000);

	error_code ec;
	TEST_EQUAL(file_size(name, ec), 3000);
	TEST_CHECK(!ec);

	piece_source src = file_piece_source(name, ec);
	TEST_CHECK(!ec);
	TEST_CHECK(bool(src));
	if (!src) return;

	chunk_buffer const first = src(piece(0), 0, 1024, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(int(first.size()), 1024);
	TEST_CHECK(matches(std::string(first.begin(), first.end()), 0));

	// the short last piece
	chunk_buffer const last = src(piece(2), 2048, 952, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(int(last.size()), 952);
	TEST_CHECK(matches(std::string(last.begin(), last.end()), 2048));

	// asking for more than the file holds
	chunk_buffer const past = src(piece(2), 2048, 1024, ec);
	TEST_EQUAL(ec, error_code(boost::asio::error::eof));
	TEST_CHECK(past.empty());

	std::remove(name.c_str());
}

PIECESTREAM_TEST(file_source_missing_file)
{
	error_code ec;
	piece_source const src = file_piece_source("test_engine_does_not_exist.bin", ec);
	TEST_EQUAL(ec, error_code(boost::system::errc::make_error_code(
		boost::system::errc::no_such_file_or_directory)));
	TEST_CHECK(!src);

	ec.clear();
	TEST_EQUAL(file_size("test_engine_does_not_exist.bin", ec), -1);
	TEST_CHECK(ec);
}

// an engine serving a file that's shorter than the content length it
// claims fails the reader at the missing piece
PIECESTREAM_TEST(file_engine)
{
	std::string const name = temp_name(".bin");
	write_content(name, 3000);

	boost::asio::io_context ioc;
	global_memory_budget budget(1024 * 1024);
	error_code ec;
	piece_source src = file_piece_source(name, ec);
	TEST_CHECK(!ec);

	{
		auto e = std::make_shared<memory_piece_engine>(
			piece_engine_params(ioc, bounded_cache_constructor(budget))
			, name, src, 3000, 1024);
		auto op = start_read(*e, byte_range(0, 2999));
		run(ioc);
		TEST_CHECK(op->done);
		TEST_CHECK(!op->ec);
		TEST_EQUAL(int(op->data.size()), 3000);
		TEST_CHECK(matches(op->data, 0));
	}

	{
		auto e = std::make_shared<memory_piece_engine>(
			piece_engine_params(ioc, bounded_cache_constructor(budget))
			, name, src, 5000, 1024);
		// piece 2 is only partly in the file
		auto op = start_read(*e, byte_range(1000, 4999));
		run(ioc);
		TEST_CHECK(op->done);
		TEST_EQUAL(op->ec, error_code(boost::asio::error::eof));
		TEST_EQUAL(int(op->data.size()), 2048 - 1000);
		TEST_CHECK(matches(op->data, 1000));
		TEST_EQUAL(e->error(), error_code(boost::asio::error::eof));
	}

	std::remove(name.c_str());
}
