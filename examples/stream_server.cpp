/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "piecestream/session.hpp"
#include "piecestream/settings_pack.hpp"
#include "piecestream/load_config.hpp"
#include "piecestream/media_file.hpp"
#include "piecestream/memory_piece_engine.hpp"
#include "piecestream/alert_logger.hpp"
#include "piecestream/alert_types.hpp"

namespace ps = piecestream;

namespace {

void print_usage()
{
	std::fprintf(stderr, "usage: stream_server [OPTIONS] file...\n\n"
		"OPTIONS:\n"
		"  -c <file>      load settings from <file>\n"
		"  -p <port>      listen on <port> (overrides the config file)\n"
		"  -i <address>   listen on <address>\n"
		"  -d <millis>    delay between fetching two pieces\n"
		"  -l <piece-len> piece length in bytes (default 1 MiB)\n"
		"  -o <log-file>  write alerts to <log-file> instead of stderr\n"
		"\n"
		"The first file with one of the media_extensions is served at\n"
		"http://<address>:<port>/stream?<name>\n");
}

std::string file_name(std::string const& path)
{
	auto const slash = path.find_last_of('/');
	return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	std::string config_file;
	std::string log_file;
	std::vector<std::string> files;
	int port = -1;
	std::string iface;
	int delay = 0;
	int piece_length = 1024 * 1024;

	for (int i = 1; i < argc; ++i)
	{
		if (argv[i][0] != '-')
		{
			files.push_back(argv[i]);
			continue;
		}

		if (i + 1 >= argc || std::strlen(argv[i]) != 2)
		{
			print_usage();
			return 1;
		}

		char const* arg = argv[++i];
		switch (argv[i - 1][1])
		{
			case 'c': config_file = arg; break;
			case 'o': log_file = arg; break;
			case 'p': port = std::atoi(arg); break;
			case 'i': iface = arg; break;
			case 'd': delay = std::atoi(arg); break;
			case 'l': piece_length = std::atoi(arg); break;
			default:
				print_usage();
				return 1;
		}
	}

	if (files.empty() || piece_length <= 0)
	{
		print_usage();
		return 1;
	}

	ps::error_code ec;
	ps::settings_pack pack;
	if (!config_file.empty())
	{
		pack = ps::load_config(config_file, ec);
		if (ec)
		{
			std::fprintf(stderr, "failed to load config \"%s\": %s\n"
				, config_file.c_str(), ec.message().c_str());
			return 1;
		}
	}
	if (port >= 0) pack.set_int(ps::settings_pack::listen_port, port);
	if (!iface.empty()) pack.set_str(ps::settings_pack::listen_interface, iface);

	ps::settings_pack const& ext_pack = pack.has_val(ps::settings_pack::media_extensions)
		? pack : ps::default_settings();
	int const index = ps::media_file_index(files
		, ext_pack.get_str(ps::settings_pack::media_extensions));
	if (index < 0)
	{
		std::fprintf(stderr, "no media file among the %d file(s)\n", int(files.size()));
		return 1;
	}
	std::string const& media_file = files[std::size_t(index)];

	std::int64_t const size = ps::file_size(media_file, ec);
	if (ec)
	{
		std::fprintf(stderr, "failed to open \"%s\": %s\n"
			, media_file.c_str(), ec.message().c_str());
		return 1;
	}

	ps::piece_source src = ps::file_piece_source(media_file, ec);
	if (ec)
	{
		std::fprintf(stderr, "failed to open \"%s\": %s\n"
			, media_file.c_str(), ec.message().c_str());
		return 1;
	}

	boost::asio::io_context ioc;
	ps::session ses(ioc, pack);
	ps::alert_logger logger(log_file);

	std::string const id = file_name(media_file);
	ses.add_transfer(id, [&](ps::piece_engine_params p)
	{
		auto e = std::make_shared<ps::memory_piece_engine>(p, id, src, size, piece_length);
		e->set_fetch_interval(ps::milliseconds(delay));
		return e;
	}, ec);
	if (ec)
	{
		std::fprintf(stderr, "failed to add \"%s\": %s\n", id.c_str(), ec.message().c_str());
		return 1;
	}

	ses.listen(ec);
	logger.drain(ses);
	if (ec) return 1;

	auto const ep = ses.listen_endpoint();
	std::fprintf(stderr, "serving \"%s\" (%" PRId64 " bytes) at http://%s:%d/stream?%s\n"
		, media_file.c_str(), size, ep.address().to_string().c_str(), int(ep.port())
		, id.c_str());

	bool quit = false;
	boost::asio::steady_timer log_timer(ioc);
	std::function<void(ps::error_code const&)> flush_log;
	flush_log = [&](ps::error_code const& e)
	{
		logger.drain(ses);
		if (e || quit) return;
		log_timer.expires_after(ps::milliseconds(200));
		log_timer.async_wait(flush_log);
	};
	flush_log(ps::error_code());

	boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&](ps::error_code const& e, int)
	{
		if (e) return;
		std::fprintf(stderr, "shutting down\n");
		quit = true;
		log_timer.cancel();
		ses.stop();
	});

	ioc.run();
	logger.drain(ses);
	return 0;
}
