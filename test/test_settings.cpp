/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include <cstdio>
#include <string>

#include "test.hpp"
#include "piecestream/settings_pack.hpp"
#include "piecestream/load_config.hpp"

using namespace piecestream;

namespace {

void write_file(std::string const& name, std::string const& content)
{
	FILE* f = std::fopen(name.c_str(), "w");
	TEST_CHECK(f != nullptr);
	if (f == nullptr) return;
	std::fwrite(content.data(), 1, content.size(), f);
	std::fclose(f);
}

std::string temp_name(char const* suffix)
{
	return "test_settings_" + std::to_string(unit_test::test_counter()) + suffix;
}

} // anonymous namespace

PIECESTREAM_TEST(defaults)
{
	settings_pack const p = default_settings();
	TEST_EQUAL(p.get_str(settings_pack::listen_interface), "127.0.0.1");
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 3000);
	TEST_EQUAL(p.get_int(settings_pack::max_chunk_size), 10 * 1024 * 1024);
	TEST_EQUAL(p.get_int(settings_pack::initial_chunk_size), 2 * 1024 * 1024);
	TEST_EQUAL(p.get_int(settings_pack::read_ahead_bytes), 5 * 1024 * 1024);
	TEST_EQUAL(p.get_int(settings_pack::piece_wait_timeout), 30000);
	TEST_EQUAL(p.get_int(settings_pack::max_memory_usage), 500);
	TEST_EQUAL(p.get_bool(settings_pack::keep_alive), true);
	TEST_EQUAL(p.get_str(settings_pack::content_type), "video/mp4");
}

PIECESTREAM_TEST(set_and_clear)
{
	settings_pack p;
	TEST_CHECK(!p.has_val(settings_pack::listen_port));
	// unset values read as the type's zero value
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 0);

	p.set_int(settings_pack::listen_port, 8080);
	p.set_str(settings_pack::content_type, "video/webm");
	p.set_bool(settings_pack::keep_alive, false);
	TEST_CHECK(p.has_val(settings_pack::listen_port));
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 8080);
	TEST_EQUAL(p.get_str(settings_pack::content_type), "video/webm");
	TEST_EQUAL(p.get_bool(settings_pack::keep_alive), false);

	// setting again replaces
	p.set_int(settings_pack::listen_port, 8081);
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 8081);

	p.clear(settings_pack::listen_port);
	TEST_CHECK(!p.has_val(settings_pack::listen_port));
	TEST_CHECK(p.has_val(settings_pack::content_type));

	p.clear();
	TEST_CHECK(!p.has_val(settings_pack::content_type));
}

PIECESTREAM_TEST(names)
{
	TEST_EQUAL(setting_by_name("listen_port"), int(settings_pack::listen_port));
	TEST_EQUAL(setting_by_name("keep_alive"), int(settings_pack::keep_alive));
	TEST_EQUAL(setting_by_name("content_type"), int(settings_pack::content_type));
	TEST_EQUAL(setting_by_name("no_such_setting"), -1);
	TEST_EQUAL(std::string(name_for_setting(settings_pack::max_chunk_size)), "max_chunk_size");
	TEST_EQUAL(std::string(name_for_setting(settings_pack::cache_control_no_cache))
		, "cache_control_no_cache");
}

PIECESTREAM_TEST(apply_and_diff)
{
	settings_pack p = default_settings();
	settings_pack changes;
	changes.set_int(settings_pack::max_memory_usage, 64);
	changes.set_bool(settings_pack::cache_control_no_cache, false);
	apply_pack(changes, p);

	TEST_EQUAL(p.get_int(settings_pack::max_memory_usage), 64);
	TEST_EQUAL(p.get_bool(settings_pack::cache_control_no_cache), false);
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 3000);

	settings_pack const diff = non_default_settings(p);
	TEST_CHECK(diff.has_val(settings_pack::max_memory_usage));
	TEST_CHECK(diff.has_val(settings_pack::cache_control_no_cache));
	TEST_CHECK(!diff.has_val(settings_pack::listen_port));
}

PIECESTREAM_TEST(load_config_file)
{
	std::string const name = temp_name(".conf");
	write_file(name,
		"# stream server settings\n"
		"\n"
		"listen_port 8000\n"
		"  listen_interface\t0.0.0.0  \n"
		"keep_alive false\n"
		"cache_control_no_cache 0\n"
		"piece_wait_timeout -1\n"
		"unknown_setting 42\n"
		"content_type video/x-matroska");

	error_code ec;
	settings_pack const p = load_config(name, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(p.get_int(settings_pack::listen_port), 8000);
	TEST_EQUAL(p.get_str(settings_pack::listen_interface), "0.0.0.0");
	TEST_EQUAL(p.get_bool(settings_pack::keep_alive), false);
	TEST_CHECK(p.has_val(settings_pack::cache_control_no_cache));
	TEST_EQUAL(p.get_bool(settings_pack::cache_control_no_cache), false);
	TEST_EQUAL(p.get_int(settings_pack::piece_wait_timeout), -1);
	// the last line has no newline
	TEST_EQUAL(p.get_str(settings_pack::content_type), "video/x-matroska");
	TEST_CHECK(!p.has_val(settings_pack::max_chunk_size));
	std::remove(name.c_str());
}

PIECESTREAM_TEST(load_config_bad_value)
{
	std::string const name = temp_name(".conf");
	write_file(name, "listen_port 80a\n");

	error_code ec;
	load_config(name, ec);
	TEST_EQUAL(ec, error_code(errc::make_error_code(errc::invalid_argument)));
	std::remove(name.c_str());

	write_file(name, "keep_alive maybe\n");
	ec.clear();
	load_config(name, ec);
	TEST_EQUAL(ec, error_code(errc::make_error_code(errc::invalid_argument)));
	std::remove(name.c_str());
}

PIECESTREAM_TEST(load_config_missing_file)
{
	error_code ec;
	load_config("this_file_does_not_exist.conf", ec);
	TEST_CHECK(ec);
}

PIECESTREAM_TEST(save_config_non_defaults)
{
	settings_pack p = default_settings();
	p.set_int(settings_pack::listen_port, 9000);
	p.set_bool(settings_pack::keep_alive, false);
	p.set_str(settings_pack::content_type, "video/webm");

	std::string const text = save_config(p);
	TEST_CHECK(text.find("listen_port 9000\n") != std::string::npos);
	TEST_CHECK(text.find("keep_alive 0\n") != std::string::npos);
	TEST_CHECK(text.find("content_type video/webm\n") != std::string::npos);
	TEST_CHECK(text.find("max_chunk_size") == std::string::npos);

	std::string const name = temp_name(".conf");
	error_code ec;
	save_config(p, name, ec);
	TEST_CHECK(!ec);
	settings_pack const loaded = load_config(name, ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(loaded.get_int(settings_pack::listen_port), 9000);
	TEST_EQUAL(loaded.get_bool(settings_pack::keep_alive), false);
	TEST_EQUAL(loaded.get_str(settings_pack::content_type), "video/webm");
	std::remove(name.c_str());
}
