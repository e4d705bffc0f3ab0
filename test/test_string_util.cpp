/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <string>
#include <vector>

#include "test.hpp"
#include "piecestream/aux_/string_util.hpp"
#include "piecestream/media_file.hpp"

using namespace piecestream;
using namespace piecestream::aux;

PIECESTREAM_TEST(case_insensitive_compare)
{
	TEST_CHECK(string_begins_no_case("bytes=", "BYTES=0-"));
	TEST_CHECK(string_begins_no_case("", "anything"));
	TEST_CHECK(!string_begins_no_case("bytes=", "byte"));
	TEST_CHECK(string_equal_no_case("Keep-Alive", "keep-alive"));
	TEST_CHECK(!string_equal_no_case("close", "closed"));
	TEST_EQUAL(to_lower("Content-LENGTH"), "content-length");
}

PIECESTREAM_TEST(trim_and_split)
{
	TEST_EQUAL(trim("  a b \t"), "a b");
	TEST_EQUAL(trim(" \t "), "");

	auto const p = split_string("path?query?more", '?');
	TEST_EQUAL(p.first, "path");
	TEST_EQUAL(p.second, "query?more");

	auto const q = split_string("no-separator", '?');
	TEST_EQUAL(q.first, "no-separator");
	TEST_CHECK(q.second.empty());

	std::vector<std::string> const items = parse_comma_separated_string(" .mp4, .mkv ,, .webm,");
	TEST_EQUAL(items.size(), 3);
	TEST_EQUAL(items[0], ".mp4");
	TEST_EQUAL(items[1], ".mkv");
	TEST_EQUAL(items[2], ".webm");
	TEST_CHECK(parse_comma_separated_string("").empty());
}

PIECESTREAM_TEST(unescape)
{
	error_code ec;
	TEST_EQUAL(unescape_string("my%20movie+1.mp4", ec), "my movie 1.mp4");
	TEST_CHECK(!ec);

	TEST_EQUAL(unescape_string("%2f%2F", ec), "//");
	TEST_CHECK(!ec);

	unescape_string("bad%2", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_escaped_string));

	ec.clear();
	unescape_string("bad%zz", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_escaped_string));
}

PIECESTREAM_TEST(json_escape)
{
	TEST_EQUAL(escape_json("plain"), "plain");
	TEST_EQUAL(escape_json("a\"b\\c"), "a\\\"b\\\\c");
	TEST_EQUAL(escape_json("line\nbreak\t"), "line\\nbreak\\t");
	TEST_EQUAL(escape_json(std::string(1, '\x01')), "\\u0001");
}

PIECESTREAM_TEST(readable_bytes)
{
	TEST_EQUAL(human_readable_bytes(512), "512 B");
	TEST_EQUAL(human_readable_bytes(1536), "1.50 KB");
	TEST_EQUAL(human_readable_bytes(10 * 1024 * 1024), "10.00 MB");
}

PIECESTREAM_TEST(extensions)
{
	TEST_EQUAL(file_extension("movie.MKV"), ".mkv");
	TEST_EQUAL(file_extension("dir.d/readme"), "");
	TEST_EQUAL(file_extension(".hidden"), "");
	TEST_EQUAL(file_extension("a/b/c.tar.gz"), ".gz");
}

PIECESTREAM_TEST(pick_media_file)
{
	std::vector<std::string> const names = {
		"README.txt", "sample/poster.jpg", "Movie.MP4", "extras/clip.mkv" };

	TEST_EQUAL(media_file_index(names, ".mp4,.mkv"), 2);
	TEST_EQUAL(media_file_index(names, " .MKV "), 3);
	TEST_EQUAL(media_file_index(names, ".avi"), -1);
	TEST_EQUAL(media_file_index(names, ""), -1);
	TEST_EQUAL(media_file_index({}, ".mp4"), -1);
}

PIECESTREAM_TEST(mime_types)
{
	TEST_EQUAL(mime_type_for("movie.mp4", "application/octet-stream"), "video/mp4");
	TEST_EQUAL(mime_type_for("MOVIE.WEBM", "application/octet-stream"), "video/webm");
	TEST_EQUAL(mime_type_for("song.mp3", "x"), "audio/mpeg");
	TEST_EQUAL(mime_type_for("archive.zip", "video/mp4"), "video/mp4");
	TEST_EQUAL(mime_type_for("no-extension", "video/mp4"), "video/mp4");
}
