/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include "test.hpp"
#include "fake_piece_engine.hpp"
#include "piecestream/session.hpp"
#include "piecestream/alert_types.hpp"
#include "piecestream/memory_budget.hpp"
#include "piecestream/memory_piece_engine.hpp"
#include "piecestream/settings_pack.hpp"

using namespace piecestream;
using boost::asio::ip::tcp;

namespace {

struct http_response
{
	// -1 if the connection was closed before a response header arrived
	int status = -1;
	std::map<std::string, std::string> headers;
	std::string body;
	error_code body_error;

	std::string header(std::string const& name) const
	{
		auto const it = headers.find(name);
		return it == headers.end() ? std::string() : it->second;
	}
};

// a blocking HTTP client on its own io_context
struct http_client
{
	explicit http_client(int const port)
	{
		m_socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1")
			, std::uint16_t(port)));
	}

	void send(std::string const& req)
	{
		boost::asio::write(m_socket, boost::asio::buffer(req));
	}

	http_response read_response(bool const head = false)
	{
		http_response ret;
		error_code ec;
		std::size_t const n = boost::asio::read_until(m_socket, m_buf, "\r\n\r\n", ec);
		if (ec) return ret;

		auto const begin = boost::asio::buffers_begin(m_buf.data());
		std::string const header(begin, begin + std::ptrdiff_t(n));
		m_buf.consume(n);

		std::string::size_type pos = header.find("\r\n");
		std::string const status_line = header.substr(0, pos);
		std::string::size_type const space = status_line.find(' ');
		if (space != std::string::npos)
			ret.status = std::atoi(status_line.c_str() + space + 1);

		pos += 2;
		while (pos < header.size())
		{
			std::string::size_type const end = header.find("\r\n", pos);
			if (end == std::string::npos || end == pos) break;
			std::string const line = header.substr(pos, end - pos);
			pos = end + 2;
			std::string::size_type const colon = line.find(':');
			if (colon == std::string::npos) continue;
			std::string name = line.substr(0, colon);
			std::transform(name.begin(), name.end(), name.begin()
				, [](char c) { return char(std::tolower(static_cast<unsigned char>(c))); });
			std::string::size_type v = colon + 1;
			while (v < line.size() && line[v] == ' ') ++v;
			ret.headers[name] = line.substr(v);
		}

		if (head) return ret;

		std::size_t const len = ret.headers.count("content-length")
			? std::size_t(std::stoll(ret.headers["content-length"])) : 0;
		if (m_buf.size() < len)
		{
			boost::asio::read(m_socket, m_buf
				, boost::asio::transfer_exactly(len - m_buf.size()), ret.body_error);
		}
		std::size_t const got = std::min(len, m_buf.size());
		auto const body = boost::asio::buffers_begin(m_buf.data());
		ret.body.assign(body, body + std::ptrdiff_t(got));
		m_buf.consume(got);
		return ret;
	}

	// true if the server closed the connection
	bool closed()
	{
		char c;
		error_code ec;
		m_socket.read_some(boost::asio::buffer(&c, 1), ec);
		return ec == boost::asio::error::eof
			|| ec == boost::asio::error::connection_reset;
	}

	void close()
	{
		error_code ec;
		m_socket.shutdown(tcp::socket::shutdown_both, ec);
		m_socket.close(ec);
	}

private:
	boost::asio::io_context m_ioc;
	tcp::socket m_socket{m_ioc};
	boost::asio::streambuf m_buf;
};

std::string get(std::string const& target, std::string const& extra = std::string())
{
	return "GET " + target + " HTTP/1.1\r\nHost: localhost\r\n" + extra + "\r\n";
}

http_response request(int const port, std::string const& req, bool const head = false)
{
	http_client c(port);
	c.send(req);
	return c.read_response(head);
}

bool body_matches(std::string const& body, std::int64_t const offset)
{
	for (std::size_t i = 0; i < body.size(); ++i)
	{
		if (body[i] != content_byte(offset + std::int64_t(i))) return false;
	}
	return true;
}

// a session listening on an ephemeral loopback port, with its io_context
// run by a background thread
struct test_server
{
	explicit test_server(settings_pack p = settings_pack())
	{
		p.set_str(settings_pack::listen_interface, "127.0.0.1");
		p.set_int(settings_pack::listen_port, 0);
		ses = std::make_unique<session>(ioc, p);

		error_code ec;
		ses->listen(ec);
		TEST_CHECK(!ec);
		port = ses->listen_endpoint().port();

		thread = std::thread([this] { ioc.run(); });
	}

	~test_server()
	{
		ses->stop();
		work.reset();
		thread.join();
		ses.reset();
	}

	// runs ``f`` on the session's thread and waits for it
	template <typename F>
	void run_on(F f)
	{
		std::promise<void> done;
		boost::asio::post(ioc, [&] { f(); done.set_value(); });
		done.get_future().wait();
	}

	// polls ``pred`` on the session's thread until it returns true or five
	// seconds pass
	template <typename Pred>
	bool wait_until(Pred pred)
	{
		for (int i = 0; i < 500; ++i)
		{
			bool ret = false;
			run_on([&] { ret = pred(); });
			if (ret) return true;
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		return false;
	}

	std::shared_ptr<fake_piece_engine> add_fake(std::string const& id
		, std::int64_t const content_length, int const piece_length)
	{
		std::shared_ptr<fake_piece_engine> ret;
		error_code ec;
		ses->add_transfer(id, [&](piece_engine_params p)
		{
			ret = std::make_shared<fake_piece_engine>(p.io_context, content_length, piece_length);
			return ret;
		}, ec);
		TEST_CHECK(!ec);
		return ret;
	}

	std::vector<std::string> alert_names()
	{
		std::vector<alert*> alerts;
		ses->pop_alerts(&alerts);
		std::vector<std::string> ret;
		for (alert* a : alerts) ret.push_back(a->what());
		return ret;
	}

	boost::asio::io_context ioc;
	boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work
		= boost::asio::make_work_guard(ioc);
	std::unique_ptr<session> ses;
	int port = 0;
	std::thread thread;
};

bool contains(std::vector<std::string> const& v, char const* s)
{
	return std::find(v.begin(), v.end(), s) != v.end();
}

piece_source generated_source()
{
	return [](piece_index_t, std::int64_t const offset, int const length, error_code&)
	{
		chunk_buffer ret(static_cast<std::size_t>(length));
		for (int i = 0; i < length; ++i) ret[std::size_t(i)] = content_byte(offset + i);
		return ret;
	};
}

} // anonymous namespace

PIECESTREAM_TEST(no_range_serves_initial_chunk)
{
	settings_pack p;
	p.set_int(settings_pack::initial_chunk_size, 65536);
	test_server s(p);

	error_code ec;
	s.ses->add_transfer("movie", [](piece_engine_params params)
	{
		return std::make_shared<memory_piece_engine>(params, "movie.mp4"
			, generated_source(), 1000000, 16384);
	}, ec);
	TEST_CHECK(!ec);

	http_response const r = request(s.port, get("/stream?id=movie"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 0-65535/1000000");
	TEST_EQUAL(r.header("content-length"), "65536");
	TEST_EQUAL(r.header("accept-ranges"), "bytes");
	TEST_EQUAL(r.header("content-type"), "video/mp4");
	TEST_EQUAL(r.header("cache-control"), "no-cache");
	TEST_EQUAL(r.body.size(), 65536);
	TEST_CHECK(body_matches(r.body, 0));
}

PIECESTREAM_TEST(open_ended_range_is_capped)
{
	settings_pack p;
	p.set_int(settings_pack::max_chunk_size, 1000);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=500-\r\n"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 500-1499/2000");
	TEST_EQUAL(r.body.size(), 1000);
	TEST_CHECK(body_matches(r.body, 500));
}

PIECESTREAM_TEST(suffix_range)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=-100\r\n"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 1900-1999/2000");
	TEST_EQUAL(r.header("content-length"), "100");
	TEST_CHECK(body_matches(r.body, 1900));
}

PIECESTREAM_TEST(unsatisfiable_range)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=1800-100\r\n"));
	TEST_EQUAL(r.status, 416);
	TEST_EQUAL(r.header("content-range"), "bytes */2000");
	TEST_EQUAL(r.header("content-length"), "0");
	TEST_CHECK(r.body.empty());

	TEST_CHECK(s.wait_until([&] { return s.ses->find_transfer("t")->active_streams() == 0; }));
	TEST_CHECK(contains(s.alert_names(), "range_rejected"));
	TEST_EQUAL(e->num_readers, 0);
}

PIECESTREAM_TEST(start_past_the_end_is_clamped)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=5000-\r\n"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 1999-1999/2000");
	TEST_EQUAL(r.body.size(), 1);
	TEST_CHECK(body_matches(r.body, 1999));
}

PIECESTREAM_TEST(head_request)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_client c(s.port);
	c.send("HEAD /stream?id=t HTTP/1.1\r\nRange: bytes=0-99\r\n\r\n");
	http_response const r = c.read_response(true);
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-length"), "100");
	TEST_EQUAL(r.header("content-range"), "bytes 0-99/2000");

	// the connection is reusable, so no body followed the header
	c.send(get("/stream?id=t", "Range: bytes=10-19\r\n"));
	http_response const r2 = c.read_response();
	TEST_EQUAL(r2.status, 206);
	TEST_EQUAL(r2.header("content-range"), "bytes 10-19/2000");
	TEST_CHECK(body_matches(r2.body, 10));
}

PIECESTREAM_TEST(keep_alive)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_client c(s.port);
	// both requests in one write, the second is pipelined
	c.send(get("/stream?id=t", "Range: bytes=0-9\r\n")
		+ get("/stream?id=t", "Range: bytes=100-199\r\n"));

	http_response const r1 = c.read_response();
	TEST_EQUAL(r1.status, 206);
	TEST_EQUAL(r1.header("content-range"), "bytes 0-9/2000");
	TEST_CHECK(body_matches(r1.body, 0));

	http_response const r2 = c.read_response();
	TEST_EQUAL(r2.status, 206);
	TEST_EQUAL(r2.header("content-range"), "bytes 100-199/2000");
	TEST_CHECK(body_matches(r2.body, 100));
	TEST_EQUAL(e->num_readers, 2);
}

// a player seeking on a reused connection sends each request only after the
// previous response arrived
PIECESTREAM_TEST(keep_alive_seek)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_client c(s.port);
	char const* ranges[] = {"0-9", "100-199", "1500-1599", "5-5"};
	std::int64_t const starts[] = {0, 100, 1500, 5};
	for (int i = 0; i < 4; ++i)
	{
		c.send(get("/stream?id=t", std::string("Range: bytes=") + ranges[i] + "\r\n"));
		http_response const r = c.read_response();
		TEST_EQUAL(r.status, 206);
		TEST_EQUAL(r.header("content-range"), std::string("bytes ") + ranges[i] + "/2000");
		TEST_CHECK(body_matches(r.body, starts[i]));
	}
	TEST_EQUAL(e->num_readers, 4);
}

PIECESTREAM_TEST(connection_close)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_client c(s.port);
	c.send(get("/stream?id=t", "Range: bytes=0-9\r\nConnection: close\r\n"));
	http_response const r = c.read_response();
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("connection"), "close");
	TEST_CHECK(c.closed());
}

PIECESTREAM_TEST(keep_alive_disabled)
{
	settings_pack p;
	p.set_bool(settings_pack::keep_alive, false);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&] { e->complete_all(); });

	http_client c(s.port);
	c.send(get("/stream?id=t", "Range: bytes=0-9\r\n"));
	http_response const r = c.read_response();
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("connection"), "close");
	TEST_CHECK(c.closed());
}

PIECESTREAM_TEST(request_errors)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);

	TEST_EQUAL(request(s.port, get("/stream?id=unknown")).status, 404);
	TEST_EQUAL(request(s.port, get("/stream")).status, 400);
	TEST_EQUAL(request(s.port, get("/stream?id=")).status, 400);
	TEST_EQUAL(request(s.port, get("/nothing-here?id=t")).status, 404);
	TEST_EQUAL(request(s.port, "garbage\r\n\r\n").status, 400);

	http_response const r = request(s.port, "POST /stream?id=t HTTP/1.1\r\n\r\n");
	TEST_EQUAL(r.status, 405);
	TEST_EQUAL(r.header("allow"), "GET, HEAD");

	http_response const r2 = request(s.port, get("/transfer?id=t"));
	TEST_EQUAL(r2.status, 405);
	TEST_EQUAL(r2.header("allow"), "DELETE");

	TEST_CHECK(contains(s.alert_names(), "request_error"));
	TEST_EQUAL(e->num_readers, 0);
}

PIECESTREAM_TEST(metadata_timeout)
{
	settings_pack p;
	p.set_int(settings_pack::metadata_timeout, 100);
	test_server s(p);
	auto e = s.add_fake("t", 0, 0);

	http_response const r = request(s.port, get("/stream?id=t"));
	TEST_EQUAL(r.status, 503);
	TEST_CHECK(s.wait_until([&] { return e->num_subscribers() == 0; }));
	TEST_EQUAL(e->num_readers, 0);
	TEST_CHECK(contains(s.alert_names(), "stream_error"));
}

PIECESTREAM_TEST(metadata_arrives_while_waiting)
{
	settings_pack p;
	p.set_int(settings_pack::metadata_timeout, 10000);
	p.set_int(settings_pack::initial_chunk_size, 1000);
	test_server s(p);
	auto e = s.add_fake("t", 0, 0);

	http_client c(s.port);
	c.send(get("/stream?id=t"));
	TEST_CHECK(s.wait_until([&] { return e->num_subscribers() > 0; }));

	s.run_on([&]
	{
		e->set_metadata(4000, 1024);
		e->complete_all();
	});

	http_response const r = c.read_response();
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 0-999/4000");
	TEST_CHECK(body_matches(r.body, 0));
}

PIECESTREAM_TEST(pieces_prioritized_before_serving)
{
	settings_pack p;
	p.set_int(settings_pack::read_ahead_bytes, 0);
	test_server s(p);
	auto e = s.add_fake("t", 4096, 1024);

	http_client c(s.port);
	c.send(get("/stream?id=t", "Range: bytes=1024-2047\r\n"));
	TEST_CHECK(s.wait_until([&] { return e->priority(1) == critical_priority; }));
	s.run_on([&]
	{
		TEST_EQUAL(e->priority(0), none_priority);
		TEST_EQUAL(e->priority(2), none_priority);
		TEST_EQUAL(e->num_readers, 0);
	});

	s.run_on([&] { e->complete_piece(1); });

	http_response const r = c.read_response();
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 1024-2047/4096");
	TEST_CHECK(body_matches(r.body, 1024));
}

PIECESTREAM_TEST(piece_wait_timeout_serves_anyway)
{
	settings_pack p;
	p.set_int(settings_pack::piece_wait_timeout, 50);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=0-499\r\n"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-range"), "bytes 0-499/2000");
	TEST_CHECK(body_matches(r.body, 0));
	TEST_CHECK(contains(s.alert_names(), "piece_wait_timeout"));
}

PIECESTREAM_TEST(reader_failure_before_header)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&]
	{
		e->complete_all();
		e->fail_create_reader = true;
	});

	http_response const r = request(s.port, get("/stream?id=t", "Range: bytes=0-99\r\n"));
	TEST_EQUAL(r.status, 500);
	TEST_EQUAL(r.header("content-length"), "0");
	TEST_CHECK(s.wait_until([&] { return s.ses->find_transfer("t")->active_streams() == 0; }));
	TEST_CHECK(contains(s.alert_names(), "stream_error"));
}

PIECESTREAM_TEST(read_failure_after_header)
{
	settings_pack p;
	p.set_int(settings_pack::send_buffer_size, 50);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);
	s.run_on([&]
	{
		e->complete_all();
		e->fail_reads_after = 100;
	});

	http_client c(s.port);
	c.send(get("/stream?id=t", "Range: bytes=0-999\r\n"));
	http_response const r = c.read_response();

	// the status was already sent. The body is cut short instead
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-length"), "1000");
	TEST_EQUAL(r.body.size(), 100);
	TEST_CHECK(r.body_error);
	TEST_CHECK(body_matches(r.body, 0));

	TEST_CHECK(s.wait_until([&] { return e->num_closed_readers == 1; }));
	std::vector<std::string> const alerts = s.alert_names();
	TEST_CHECK(contains(alerts, "stream_error"));
	TEST_CHECK(contains(alerts, "stream_finished"));
}

PIECESTREAM_TEST(disconnect_while_waiting)
{
	settings_pack p;
	p.set_int(settings_pack::piece_wait_timeout, 60000);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);
	std::shared_ptr<transfer> t = s.ses->find_transfer("t");

	http_client c(s.port);
	c.send(get("/stream?id=t"));
	TEST_CHECK(s.wait_until([&] { return t->active_streams() == 1; }));
	TEST_CHECK(s.wait_until([&] { return e->num_subscribers() > 0; }));

	c.close();
	TEST_CHECK(s.wait_until([&]
	{
		return t->active_streams() == 0 && e->num_subscribers() == 0;
	}));
	TEST_EQUAL(e->num_readers, 0);
}

PIECESTREAM_TEST(disconnect_while_streaming)
{
	int const length = 64 * 1024 * 1024;
	settings_pack p;
	p.set_int(settings_pack::max_chunk_size, length);
	test_server s(p);
	auto e = s.add_fake("t", length, 1024 * 1024);
	s.run_on([&] { e->complete_all(); });
	std::shared_ptr<transfer> t = s.ses->find_transfer("t");

	http_client c(s.port);
	c.send(get("/stream?id=t", "Range: bytes=0-\r\n"));
	http_response const r = c.read_response(true);
	TEST_EQUAL(r.status, 206);
	c.close();

	TEST_CHECK(s.wait_until([&]
	{
		return t->active_streams() == 0 && e->num_closed_readers == 1;
	}));

	std::vector<alert*> alerts;
	s.ses->pop_alerts(&alerts);
	stream_finished_alert const* fin = nullptr;
	for (alert* a : alerts)
		if (auto f = alert_cast<stream_finished_alert>(a)) fin = f;
	TEST_CHECK(fin != nullptr);
	if (fin)
	{
		TEST_CHECK(!fin->completed);
		TEST_CHECK(fin->bytes_sent < length);
	}
}

PIECESTREAM_TEST(remove_transfer_aborts_streams)
{
	settings_pack p;
	p.set_int(settings_pack::piece_wait_timeout, 60000);
	test_server s(p);
	auto e = s.add_fake("t", 2000, 256);
	std::shared_ptr<transfer> t = s.ses->find_transfer("t");

	http_client c(s.port);
	c.send(get("/stream?id=t"));
	TEST_CHECK(s.wait_until([&] { return t->active_streams() == 1; }));

	error_code ec;
	s.ses->remove_transfer("t", ec);
	TEST_CHECK(!ec);

	// the connection is closed without a response
	TEST_EQUAL(c.read_response().status, -1);
	TEST_CHECK(s.wait_until([&] { return t->active_streams() == 0; }));
	TEST_CHECK(s.ses->find_transfer("t") == nullptr);

	s.ses->remove_transfer("t", ec);
	TEST_EQUAL(ec, error_code(errors::transfer_not_found));
}

PIECESTREAM_TEST(transfers_and_status)
{
	test_server s;
	auto e = s.add_fake("first", 2000, 256);
	auto e2 = s.add_fake("second", 0, 0);
	s.run_on([&]
	{
		e->complete_piece(0);
		e->complete_piece(1);
		e->complete_piece(5);
	});

	http_response const r = request(s.port, get("/transfers"));
	TEST_EQUAL(r.status, 200);
	TEST_EQUAL(r.header("content-type"), "application/json");
	TEST_EQUAL(r.body, "{\"transfers\":["
		"{\"id\":\"first\",\"name\":\"fake.mp4\",\"content_length\":2000"
		",\"piece_length\":256,\"num_pieces\":8,\"num_downloaded\":3,\"active_streams\":0}"
		",{\"id\":\"second\",\"name\":\"fake.mp4\",\"content_length\":0"
		",\"piece_length\":0,\"num_pieces\":0,\"num_downloaded\":0,\"active_streams\":0}"
		"]}");

	http_response const st = request(s.port, get("/status?id=first"));
	TEST_EQUAL(st.status, 200);
	TEST_CHECK(st.body.find("\"downloaded\":[[0,1],[5,5]]") != std::string::npos);
	TEST_CHECK(st.body.find("\"prioritized\":[]") != std::string::npos);
	TEST_CHECK(st.body.find("\"budget\":{") != std::string::npos);

	TEST_EQUAL(request(s.port, get("/status?id=third")).status, 404);

	std::vector<std::string> ids = s.ses->transfers();
	std::sort(ids.begin(), ids.end());
	TEST_EQUAL(ids.size(), 2);
	TEST_EQUAL(ids[0], "first");
	TEST_EQUAL(ids[1], "second");
}

PIECESTREAM_TEST(delete_transfer)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);

	http_response const r = request(s.port, "DELETE /transfer?id=t HTTP/1.1\r\n\r\n");
	TEST_EQUAL(r.status, 204);
	TEST_CHECK(s.ses->find_transfer("t") == nullptr);
	TEST_EQUAL(request(s.port, get("/stream?id=t")).status, 404);
	TEST_EQUAL(request(s.port, "DELETE /transfer?id=t HTTP/1.1\r\n\r\n").status, 404);
	TEST_CHECK(contains(s.alert_names(), "transfer_removed"));
}

PIECESTREAM_TEST(duplicate_transfer)
{
	test_server s;
	auto e = s.add_fake("t", 2000, 256);

	bool called = false;
	error_code ec;
	s.ses->add_transfer("t", [&](piece_engine_params p)
	{
		called = true;
		return std::make_shared<fake_piece_engine>(p.io_context, 10, 1);
	}, ec);
	TEST_EQUAL(ec, error_code(errors::duplicate_transfer));
	TEST_CHECK(!called);
	TEST_EQUAL(s.ses->transfers().size(), 1);
}

PIECESTREAM_TEST(stream_within_memory_budget)
{
	int const length = 2 * 1024 * 1024;
	settings_pack p;
	p.set_int(settings_pack::max_memory_usage, 1);
	p.set_int(settings_pack::max_chunk_size, length);
	p.set_int(settings_pack::piece_wait_timeout, 100);
	test_server s(p);

	std::shared_ptr<memory_piece_engine> e;
	error_code ec;
	s.ses->add_transfer("movie", [&](piece_engine_params params)
	{
		e = std::make_shared<memory_piece_engine>(params, "movie.mkv"
			, generated_source(), length, 128 * 1024);
		return e;
	}, ec);
	TEST_CHECK(!ec);

	http_response const r = request(s.port, get("/stream?id=movie", "Range: bytes=0-\r\n"));
	TEST_EQUAL(r.status, 206);
	TEST_EQUAL(r.header("content-type"), "video/x-matroska");
	TEST_EQUAL(r.body.size(), length);
	TEST_CHECK(body_matches(r.body, 0));

	// the content doesn't fit in the budget. Pieces were evicted and
	// fetched again while streaming
	global_memory_budget& budget = s.ses->memory_budget();
	TEST_CHECK(budget.total_bytes() <= 1024 * 1024);
	TEST_CHECK(budget.stats().evictions > 0);
	TEST_CHECK(e->num_fetches() > 16);

	error_code sec;
	transfer_status const st = s.ses->status("movie", sec);
	TEST_CHECK(!sec);
	TEST_CHECK(st.cache_bytes <= 1024 * 1024);

	s.ses->remove_transfer("movie", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(budget.total_bytes(), 0);
}
