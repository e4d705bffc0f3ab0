/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_SETTINGS_PACK_HPP_INCLUDED
#define PIECESTREAM_SETTINGS_PACK_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "piecestream/config.hpp"

// The settings_pack holds a sparse set of configuration values for the
// session. Settings are addressed by enum values that also encode their type
// (string, int or bool). Only the settings that have been set are stored,
// which makes it possible to apply a pack on top of existing settings,
// changing only the values it contains.

namespace piecestream {

	struct settings_pack;

	// returns the setting with the given name, or -1 if there is no such
	// setting
	PIECESTREAM_EXPORT int setting_by_name(std::string_view name);
	PIECESTREAM_EXPORT char const* name_for_setting(int s);

	// returns a settings_pack with every setting set to its default value
	PIECESTREAM_EXPORT settings_pack default_settings();

	// copies every value set in ``src`` into ``dst``
	PIECESTREAM_EXPORT void apply_pack(settings_pack const& src, settings_pack& dst);

	// the settings in ``p`` whose values differ from the defaults
	PIECESTREAM_EXPORT settings_pack non_default_settings(settings_pack const& p);

	struct PIECESTREAM_EXPORT settings_pack
	{
		void set_str(int name, std::string val);
		void set_int(int name, int val);
		void set_bool(int name, bool val);

		// queries whether the specified setting has a value in this pack
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		// returns the value of the setting, or the empty string/0/false if
		// it is not set in this pack
		std::string const& get_str(int name) const;
		int get_int(int name) const;
		bool get_bool(int name) const;

		// calls f for every setting set in the pack
		template <typename Fun>
		void for_each(Fun&& f) const
		{
			for (auto const& s : m_strings) f(s.first, s.second);
			for (auto const& i : m_ints) f(i.first, i.second);
			for (auto const& b : m_bools) f(b.first, b.second);
		}

		enum type_bases
		{
			string_type_base = 0x0000,
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		// hidden
		enum string_types
		{
			// the IP address the stream server listens on
			listen_interface = string_type_base,

			// the Content-Type of stream responses, for transfers that
			// don't provide their own
			content_type,

			// comma separated list of file extensions (including the dot)
			// that identify the media file of a multi-file transfer
			media_extensions,

			max_string_setting_internal
		};

		// hidden
		enum bool_types
		{
			// allow more than one request per connection
			keep_alive = bool_type_base,

			// send ``Cache-Control: no-cache`` with stream responses
			cache_control_no_cache,

			max_bool_setting_internal
		};

		// hidden
		enum int_types
		{
			// the TCP port the stream server listens on. 0 picks a free port
			listen_port = int_type_base,

			// the largest number of bytes sent in response to one Range
			// request, in bytes
			max_chunk_size,

			// the number of bytes sent in response to a request without a
			// Range header
			initial_chunk_size,

			// the number of bytes past the end of a requested range whose
			// pieces are prioritized along with it
			read_ahead_bytes,

			// the number of milliseconds a stream request waits for its
			// pieces before it's served anyway
			piece_wait_timeout,

			// the number of milliseconds a stream request waits for the
			// engine to learn the content layout
			metadata_timeout,

			// the upper limit of memory used by cached pieces across all
			// transfers, in MiB
			max_memory_usage,

			// the upper limit of alerts held in the alert queue
			alert_queue_size,

			// a bitmask of alert_category flags
			alert_mask,

			// requests with a larger header are rejected
			max_request_header_size,

			// the number of bytes read from the piece engine and written to
			// the socket at a time
			send_buffer_size,

			// seconds an idle keep-alive connection stays open
			connection_idle_timeout,

			max_int_setting_internal
		};

		constexpr static int num_string_settings = int(max_string_setting_internal) - int(string_type_base);
		constexpr static int num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base);
		constexpr static int num_int_settings = int(max_int_setting_internal) - int(int_type_base);

	private:

		std::vector<std::pair<std::uint16_t, std::string>> m_strings;
		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};
}

#endif // PIECESTREAM_SETTINGS_PACK_HPP_INCLUDED
