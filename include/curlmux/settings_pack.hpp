/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_SETTINGS_PACK_HPP_INCLUDED
#define CURLMUX_SETTINGS_PACK_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace curlmux {

	struct settings_pack;

	CURLMUX_EXPORT int setting_by_name(std::string_view name);
	CURLMUX_EXPORT char const* name_for_setting(int s);

	// The ``settings_pack`` holds the configuration of a multiplexer and of
	// the transfers created from its environment. Settings that are not set
	// read back as their default value.
	//
	// Each setting is identified by an enum value whose type is encoded in
	// its upper bits: string, int or bool.
	struct CURLMUX_EXPORT settings_pack
	{
		void set_str(int name, std::string val);
		void set_int(int name, int val);
		void set_bool(int name, bool val);
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		// queries the current configuration option from the settings_pack.
		// If the setting is not set, its default value is returned
		std::string const& get_str(int name) const;
		int get_int(int name) const;
		bool get_bool(int name) const;

		enum type_bases
		{
			string_type_base = 0x0000,
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		enum string_types
		{
			// path to a PEM bundle of trusted certificate authorities. When
			// empty, the bundle installed with curlmux is used, if present
			ca_bundle = string_type_base,

			// the user agent sent by transfers that don't set one explicitly.
			// An empty string leaves libcurl's default (no header)
			user_agent,

			max_string_setting_internal
		};

		enum int_types
		{
			// seconds allowed for the connection phase of a transfer
			connect_timeout = int_type_base,

			// milliseconds a ``do_transfer()`` caller sleeps between driving
			// the scheduler
			poll_interval,

			// seconds without traffic before a tunnel relay gives up
			tunnel_idle_timeout,

			// the largest number of bytes received from one side of a tunnel
			// in a single read
			tunnel_chunk_size,

			// limits passed on to CURLMOPT_MAX_TOTAL_CONNECTIONS and
			// CURLMOPT_MAX_HOST_CONNECTIONS. 0 means no limit
			max_total_connections,
			max_host_connections,

			max_int_setting_internal
		};

		enum bool_types
		{
			// install the libcurl trace callback on every transfer. Proxy
			// authentication discovery depends on it
			verbose_trace = bool_type_base,

			// replace the values of authorization headers in trace output
			// sent to the logger
			sanitize_log,

			// when true, ``do_transfer()`` runs transfers through the multi
			// interface. Otherwise each one runs with ``perform()``
			multiplexed_transfers,

			max_bool_setting_internal
		};

		// hidden
		enum settings_counts_t : std::uint16_t
		{
			num_string_settings = int(max_string_setting_internal) - int(string_type_base),
			num_int_settings = int(max_int_setting_internal) - int(int_type_base),
			num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base)
		};

	private:

		std::vector<std::pair<std::uint16_t, std::string>> m_strings;
		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};
}

#endif
