/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/http_parser.hpp"
#include "piecestream/aux_/string_util.hpp"
#include "piecestream/assert.hpp"

#include <algorithm>
#include <limits>

namespace piecestream {

namespace {

	// returns the characters up to ``sep`` and moves ``pos`` past it
	std::string_view read_until(std::string_view& str, char const sep)
	{
		auto const i = str.find(sep);
		std::string_view const ret = str.substr(0, i);
		str = (i == std::string_view::npos) ? std::string_view() : str.substr(i + 1);
		return ret;
	}

	bool parse_content_length(std::string_view const v, std::int64_t& out)
	{
		if (v.empty()) return false;
		std::int64_t ret = 0;
		for (char const c : v)
		{
			if (!aux::is_digit(c)) return false;
			if (ret > (std::numeric_limits<std::int64_t>::max() - 9) / 10) return false;
			ret = ret * 10 + (c - '0');
		}
		out = ret;
		return true;
	}
}

	http_request_parser::http_request_parser(int const max_header_size)
		: m_max_header_size(max_header_size)
	{}

	std::string const& http_request_parser::header(std::string_view const key) const
	{
		static std::string const empty;
		auto const i = m_header.find(key);
		if (i == m_header.end()) return empty;
		return i->second;
	}

	bool http_request_parser::has_header(std::string_view const key) const
	{
		return m_header.find(key) != m_header.end();
	}

	bool http_request_parser::keep_alive() const
	{
		std::string const& connection = header("connection");
		if (m_protocol == "HTTP/1.0")
			return aux::string_begins_no_case("keep-alive", connection);
		return !aux::string_begins_no_case("close", connection);
	}

	int http_request_parser::incoming(boost::asio::const_buffer const recv_buffer
		, error_code& ec)
	{
		if (m_state == error_state)
		{
			ec = errors::http_parse_error;
			return 0;
		}

		char const* const begin = static_cast<char const*>(recv_buffer.data());
		char const* const end = begin + recv_buffer.size();
		PIECESTREAM_ASSERT(m_recv_pos <= int(recv_buffer.size()));
		int const start_pos = m_recv_pos;
		char const* pos = begin + m_recv_pos;

		if (m_state == read_request_line)
		{
			char const* newline = std::find(pos, end, '\n');
			// if we don't have a full line yet, wait.
			if (newline == end)
			{
				if (recv_buffer.size() > std::size_t(m_max_header_size))
				{
					m_state = error_state;
					ec = errors::http_header_too_large;
				}
				return 0;
			}

			char const* line_end = newline;
			if (pos != line_end && *(line_end - 1) == '\r') --line_end;
			std::string_view line(pos, std::size_t(line_end - pos));

			++newline;
			m_recv_pos += int(newline - pos);
			pos = newline;

			std::string_view const method = read_until(line, ' ');
			std::string_view const target = read_until(line, ' ');
			std::string_view const protocol = line;

			if (method.empty() || target.empty()
				|| protocol.substr(0, 5) != "HTTP/")
			{
				m_state = error_state;
				ec = errors::http_parse_error;
				return m_recv_pos - start_pos;
			}

			m_method = aux::to_lower(method);
			m_path.assign(target.data(), target.size());
			m_protocol.assign(protocol.data(), protocol.size());

			// the content length is assumed to be 0 for requests
			m_content_length = 0;
			m_state = read_header;
		}

		if (m_state == read_header)
		{
			char const* newline = std::find(pos, end, '\n');
			while (newline != end && m_state == read_header)
			{
				// if the LF character is preceded by a CR
				// character, don't include it in the line
				char const* line_end = newline;
				if (pos != line_end && *(line_end - 1) == '\r') --line_end;
				std::string_view const line(pos, std::size_t(line_end - pos));
				++newline;
				m_recv_pos += int(newline - pos);
				pos = newline;

				if (line.empty())
				{
					// a blank line ends the header
					m_state = read_body;
					m_body_start_pos = m_recv_pos;
					break;
				}

				auto const separator = line.find(':');
				if (separator == std::string_view::npos || separator == 0)
				{
					m_state = error_state;
					ec = errors::http_parse_error;
					return m_recv_pos - start_pos;
				}

				std::string name = aux::to_lower(aux::trim(line.substr(0, separator)));
				std::string_view const value = aux::trim(line.substr(separator + 1));

				if (name == "content-length")
				{
					if (!parse_content_length(value, m_content_length))
					{
						m_state = error_state;
						ec = errors::http_parse_error;
						return m_recv_pos - start_pos;
					}
				}

				// repeated headers are combined into one comma separated
				// value
				auto const i = m_header.find(name);
				if (i == m_header.end())
				{
					m_header.emplace(std::move(name), std::string(value));
				}
				else
				{
					i->second += ", ";
					i->second.append(value.data(), value.size());
				}

				newline = std::find(pos, end, '\n');
			}

			if (m_state == read_header ? recv_buffer.size() > std::size_t(m_max_header_size)
				: m_body_start_pos > m_max_header_size)
			{
				m_state = error_state;
				ec = errors::http_header_too_large;
				return m_recv_pos - start_pos;
			}
		}

		if (m_state == read_body)
		{
			// requests this server understands carry no body. Any body is
			// skipped
			std::int64_t const received = std::int64_t(recv_buffer.size()) - m_body_start_pos;
			std::int64_t const consumed = std::min(received, m_content_length);
			m_recv_pos = m_body_start_pos + int(consumed);
			if (consumed == m_content_length) m_finished = true;
		}

		return m_recv_pos - start_pos;
	}

	void http_request_parser::reset()
	{
		m_method.clear();
		m_path.clear();
		m_protocol.clear();
		m_recv_pos = 0;
		m_body_start_pos = 0;
		m_content_length = 0;
		m_finished = false;
		m_state = read_request_line;
		m_header.clear();
	}

	request_target parse_request_target(std::string_view const target, error_code& ec)
	{
		request_target ret;
		auto const parts = aux::split_string(target, '?');
		ret.path = aux::unescape_string(parts.first, ec);
		if (ec) return ret;
		ret.query.assign(parts.second.data(), parts.second.size());
		return ret;
	}

	std::string query_value(std::string_view query, std::string_view const key
		, error_code& ec)
	{
		while (!query.empty())
		{
			std::string_view param = read_until(query, '&');
			std::string_view const name = read_until(param, '=');
			if (name != key) continue;
			return aux::unescape_string(param, ec);
		}
		return {};
	}

	std::string transfer_id_from_query(std::string_view const query, error_code& ec)
	{
		if (query.find('=') == std::string_view::npos)
			return aux::unescape_string(query, ec);
		return query_value(query, "id", ec);
	}
}
