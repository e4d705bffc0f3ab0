/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/settings_pack.hpp"
#include "piecestream/alert.hpp"
#include "piecestream/assert.hpp"

#include <algorithm>
#include <array>

namespace {

	template <class T>
	using setting_vector = std::vector<std::pair<std::uint16_t, T>>;

	// settings are kept sorted by name, at most one entry per name
	template <class T>
	auto lower_bound_name(setting_vector<T> const& c, int const name)
	{
		return std::partition_point(c.begin(), c.end()
			, [name](std::pair<std::uint16_t, T> const& e) { return e.first < name; });
	}

	template <class T>
	void set_sorted(setting_vector<T>& c, int const name, T v)
	{
		auto const i = c.begin() + (lower_bound_name(c, name) - c.cbegin());
		if (i != c.end() && i->first == name) i->second = std::move(v);
		else c.emplace(i, static_cast<std::uint16_t>(name), std::move(v));
	}

	template <class T>
	auto find_setting(setting_vector<T> const& c, int const name)
	{
		auto const i = lower_bound_name(c, name);
		return (i != c.end() && i->first == name) ? i : c.end();
	}

	// if a string setting is not set, the empty string is returned
	char const* ensure_string(char const* str)
	{ return str == nullptr ? "" : str; }
}

namespace piecestream {

	struct str_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		char const* default_value;
	};

	struct int_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		// the name of this setting. used for serialization and deserialization
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	constexpr int MiB = 1024 * 1024;

	std::array<str_setting_entry_t, settings_pack::num_string_settings> const str_settings =
	{{
		SET(listen_interface, "127.0.0.1"),
		SET(content_type, "video/mp4"),
		SET(media_extensions, ".mp4,.mkv,.avi,.mov,.webm,.m4v")
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings =
	{{
		SET(keep_alive, true),
		SET(cache_control_no_cache, true)
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings =
	{{
		SET(listen_port, 3000),
		SET(max_chunk_size, 10 * MiB),
		SET(initial_chunk_size, 2 * MiB),
		SET(read_ahead_bytes, 5 * MiB),
		SET(piece_wait_timeout, 30000),
		SET(metadata_timeout, 30000),
		SET(max_memory_usage, 500),
		SET(alert_queue_size, 1000),
		SET(alert_mask, int(static_cast<std::uint32_t>(alert_category::error
			| alert_category::status
			| alert_category::stream
			| alert_category::performance_warning))),
		SET(max_request_header_size, 8192),
		SET(send_buffer_size, 64 * 1024),
		SET(connection_idle_timeout, 60)
	}};

#undef SET

	} // anonymous namespace

	int setting_by_name(std::string_view const key)
	{
		for (int k = 0; k < int(str_settings.size()); ++k)
		{
			if (key != str_settings[std::size_t(k)].name) continue;
			return settings_pack::string_type_base + k;
		}
		for (int k = 0; k < int(int_settings.size()); ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < int(bool_settings.size()); ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		int const idx = s & settings_pack::index_mask;
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				if (idx >= settings_pack::num_string_settings) break;
				return str_settings[std::size_t(idx)].name;
			case settings_pack::int_type_base:
				if (idx >= settings_pack::num_int_settings) break;
				return int_settings[std::size_t(idx)].name;
			case settings_pack::bool_type_base:
				if (idx >= settings_pack::num_bool_settings) break;
				return bool_settings[std::size_t(idx)].name;
		}
		return "";
	}

	settings_pack default_settings()
	{
		settings_pack ret;
		for (int i = 0; i < settings_pack::num_string_settings; ++i)
		{
			ret.set_str(settings_pack::string_type_base + i
				, ensure_string(str_settings[std::size_t(i)].default_value));
		}

		for (int i = 0; i < settings_pack::num_int_settings; ++i)
		{
			ret.set_int(settings_pack::int_type_base + i
				, int_settings[std::size_t(i)].default_value);
		}

		for (int i = 0; i < settings_pack::num_bool_settings; ++i)
		{
			ret.set_bool(settings_pack::bool_type_base + i
				, bool_settings[std::size_t(i)].default_value);
		}
		return ret;
	}

	namespace {

		struct apply_visitor
		{
			settings_pack& dst;
			void operator()(int const name, std::string const& v) const { dst.set_str(name, v); }
			void operator()(int const name, int const v) const { dst.set_int(name, v); }
			void operator()(int const name, bool const v) const { dst.set_bool(name, v); }
		};
	}

	void apply_pack(settings_pack const& src, settings_pack& dst)
	{
		src.for_each(apply_visitor{dst});
	}

	settings_pack non_default_settings(settings_pack const& p)
	{
		settings_pack ret;
		for (int i = 0; i < settings_pack::num_string_settings; ++i)
		{
			int const name = settings_pack::string_type_base + i;
			if (!p.has_val(name)) continue;
			if (p.get_str(name) == ensure_string(str_settings[std::size_t(i)].default_value))
				continue;
			ret.set_str(name, p.get_str(name));
		}

		for (int i = 0; i < settings_pack::num_int_settings; ++i)
		{
			int const name = settings_pack::int_type_base + i;
			if (!p.has_val(name)) continue;
			if (p.get_int(name) == int_settings[std::size_t(i)].default_value) continue;
			ret.set_int(name, p.get_int(name));
		}

		for (int i = 0; i < settings_pack::num_bool_settings; ++i)
		{
			int const name = settings_pack::bool_type_base + i;
			if (!p.has_val(name)) continue;
			if (p.get_bool(name) == bool_settings[std::size_t(i)].default_value) continue;
			ret.set_bool(name, p.get_bool(name));
		}
		return ret;
	}

	void settings_pack::set_str(int const name, std::string val)
	{
		PIECESTREAM_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return;
		if ((name & index_mask) >= num_string_settings) return;
		set_sorted(m_strings, name, std::move(val));
	}

	void settings_pack::set_int(int const name, int const val)
	{
		PIECESTREAM_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		if ((name & index_mask) >= num_int_settings) return;
		set_sorted(m_ints, name, val);
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		PIECESTREAM_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		if ((name & index_mask) >= num_bool_settings) return;
		set_sorted(m_bools, name, val);
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case string_type_base:
				return find_setting(m_strings, name) != m_strings.end();
			case int_type_base:
				return find_setting(m_ints, name) != m_ints.end();
			case bool_type_base:
				return find_setting(m_bools, name) != m_bools.end();
		}
		PIECESTREAM_ASSERT_FAIL();
		return false;
	}

	std::string const& settings_pack::get_str(int const name) const
	{
		static std::string const empty;
		PIECESTREAM_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return empty;

		auto const i = find_setting(m_strings, name);
		if (i != m_strings.end()) return i->second;
		return empty;
	}

	int settings_pack::get_int(int const name) const
	{
		PIECESTREAM_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;

		auto const i = find_setting(m_ints, name);
		if (i != m_ints.end()) return i->second;
		return 0;
	}

	bool settings_pack::get_bool(int const name) const
	{
		PIECESTREAM_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;

		auto const i = find_setting(m_bools, name);
		if (i != m_bools.end()) return i->second;
		return false;
	}

	void settings_pack::clear()
	{
		m_strings.clear();
		m_ints.clear();
		m_bools.clear();
	}

	void settings_pack::clear(int const name)
	{
		switch (name & type_mask)
		{
			case string_type_base:
			{
				auto const i = find_setting(m_strings, name);
				if (i != m_strings.end()) m_strings.erase(i);
				break;
			}
			case int_type_base:
			{
				auto const i = find_setting(m_ints, name);
				if (i != m_ints.end()) m_ints.erase(i);
				break;
			}
			case bool_type_base:
			{
				auto const i = find_setting(m_bools, name);
				if (i != m_bools.end()) m_bools.erase(i);
				break;
			}
		}
	}
}
