/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/load_config.hpp"
#include "piecestream/aux_/string_util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <type_traits>

namespace piecestream {

namespace {

	bool parse_int(std::string_view v, int& out)
	{
		if (v.empty()) return false;
		bool negative = false;
		if (v.front() == '-')
		{
			negative = true;
			v.remove_prefix(1);
			if (v.empty()) return false;
		}
		std::int64_t ret = 0;
		for (char const c : v)
		{
			if (!aux::is_digit(c)) return false;
			ret = ret * 10 + (c - '0');
			if (ret > std::numeric_limits<int>::max()) return false;
		}
		out = static_cast<int>(negative ? -ret : ret);
		return true;
	}

	// applies one "key value" line to the pack
	void parse_line(std::string_view line, settings_pack& p, error_code& ec)
	{
		line = aux::trim(line);
		if (line.empty() || line.front() == '#') return;

		std::string_view key;
		std::string_view value;
		std::size_t const sep = line.find_first_of(" \t");
		if (sep == std::string_view::npos)
		{
			key = line;
		}
		else
		{
			key = line.substr(0, sep);
			value = aux::trim(line.substr(sep + 1));
		}

		int const setting_name = setting_by_name(key);
		if (setting_name < 0) return;

		switch (setting_name & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				p.set_str(setting_name, std::string(value));
				break;
			case settings_pack::int_type_base:
			{
				int v = 0;
				if (!parse_int(value, v))
				{
					ec = errc::make_error_code(errc::invalid_argument);
					return;
				}
				p.set_int(setting_name, v);
				break;
			}
			case settings_pack::bool_type_base:
			{
				int v = 0;
				if (value == "true") v = 1;
				else if (value != "false" && !parse_int(value, v))
				{
					ec = errc::make_error_code(errc::invalid_argument);
					return;
				}
				p.set_bool(setting_name, v != 0);
				break;
			}
		}
	}
}

	settings_pack load_config(std::string const& config_file, error_code& ec)
	{
		settings_pack p;

		FILE* f = std::fopen(config_file.c_str(), "r");
		if (f == nullptr)
		{
			ec.assign(errno, boost::system::generic_category());
			return p;
		}

		std::string line;
		char buf[512];
		while (std::fgets(buf, sizeof(buf), f) != nullptr)
		{
			line += buf;
			if (line.back() != '\n' && !std::feof(f)) continue;
			parse_line(line, p, ec);
			line.clear();
			if (ec) break;
		}
		if (!ec && !line.empty()) parse_line(line, p, ec);

		std::fclose(f);
		return p;
	}

	std::string save_config(settings_pack const& p)
	{
		std::string ret;
		settings_pack const diff = non_default_settings(p);
		diff.for_each([&](int const name, auto const& v)
		{
			ret += name_for_setting(name);
			ret += ' ';
			using value_type = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<value_type, std::string>)
				ret += v;
			else if constexpr (std::is_same_v<value_type, bool>)
				ret += v ? "1" : "0";
			else
				ret += std::to_string(v);
			ret += '\n';
		});
		return ret;
	}

	void save_config(settings_pack const& p, std::string const& config_file
		, error_code& ec)
	{
		FILE* f = std::fopen(config_file.c_str(), "w+");
		if (f == nullptr)
		{
			ec.assign(errno, boost::system::generic_category());
			return;
		}

		std::string const buf = save_config(p);
		if (std::fwrite(buf.data(), 1, buf.size(), f) != buf.size())
			ec.assign(errno, boost::system::generic_category());
		std::fclose(f);
	}
}
