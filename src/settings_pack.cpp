/*

Copyright (c) 2014-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/config.hpp"
#include "curlmux/settings_pack.hpp"
#include "curlmux/assert.hpp"

#include <algorithm>
#include <array>

namespace {

	template <class T>
	bool compare_first(std::pair<std::uint16_t, T> const& lhs
		, std::pair<std::uint16_t, T> const& rhs)
	{
		return lhs.first < rhs.first;
	}

	template <class T>
	void insort_replace(std::vector<std::pair<std::uint16_t, T>>& c, std::pair<std::uint16_t, T> v)
	{
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == v.first) i->second = std::move(v.second);
		else c.emplace(i, std::move(v));
	}

	template <class T>
	T const* find_value(std::vector<std::pair<std::uint16_t, T>> const& c, int const name)
	{
		std::pair<std::uint16_t, T> v{std::uint16_t(name), T()};
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) return &i->second;
		return nullptr;
	}

	template <class T>
	void erase_value(std::vector<std::pair<std::uint16_t, T>>& c, int const name)
	{
		std::pair<std::uint16_t, T> v{std::uint16_t(name), T()};
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) c.erase(i);
	}
}

namespace curlmux {

	struct str_setting_entry_t
	{
		// the name of this setting. used for looking settings up by name
		char const* name;
		char const* default_value;
	};

	struct int_setting_entry_t
	{
		// the name of this setting. used for looking settings up by name
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		// the name of this setting. used for looking settings up by name
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	std::array<str_setting_entry_t, settings_pack::num_string_settings> const str_settings =
	{{
		SET(ca_bundle, ""),
		SET(user_agent, "")
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings =
	{{
		SET(connect_timeout, 60),
		SET(poll_interval, 10),
		SET(tunnel_idle_timeout, 30),
		SET(tunnel_chunk_size, 4096),
		SET(max_total_connections, 0),
		SET(max_host_connections, 0)
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings =
	{{
		SET(verbose_trace, true),
		SET(sanitize_log, true),
		SET(multiplexed_transfers, true)
	}};

	} // anonymous namespace

#undef SET

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
		std::size_t const idx = std::size_t(s & settings_pack::index_mask);
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				if (idx < str_settings.size()) return str_settings[idx].name;
				break;
			case settings_pack::int_type_base:
				if (idx < int_settings.size()) return int_settings[idx].name;
				break;
			case settings_pack::bool_type_base:
				if (idx < bool_settings.size()) return bool_settings[idx].name;
				break;
		}
		return "";
	}

	void settings_pack::set_str(int const name, std::string val)
	{
		CURLMUX_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return;
		insort_replace(m_strings, {std::uint16_t(name), std::move(val)});
	}

	void settings_pack::set_int(int const name, int const val)
	{
		CURLMUX_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		insort_replace(m_ints, {std::uint16_t(name), val});
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		CURLMUX_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		insort_replace(m_bools, {std::uint16_t(name), val});
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case string_type_base: return find_value(m_strings, name) != nullptr;
			case int_type_base: return find_value(m_ints, name) != nullptr;
			case bool_type_base: return find_value(m_bools, name) != nullptr;
		}
		return false;
	}

	std::string const& settings_pack::get_str(int const name) const
	{
		static std::string const empty;
		CURLMUX_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return empty;

		if (auto const* v = find_value(m_strings, name)) return *v;

		// the defaults are string literals, keep one std::string per setting
		// around to hand out references to
		static std::array<std::string, num_string_settings> const defaults = []
		{
			std::array<std::string, num_string_settings> ret;
			for (std::size_t i = 0; i < ret.size(); ++i)
				ret[i] = str_settings[i].default_value;
			return ret;
		}();
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= defaults.size()) return empty;
		return defaults[idx];
	}

	int settings_pack::get_int(int const name) const
	{
		CURLMUX_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;

		if (auto const* v = find_value(m_ints, name)) return *v;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= int_settings.size()) return 0;
		return int_settings[idx].default_value;
	}

	bool settings_pack::get_bool(int const name) const
	{
		CURLMUX_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;

		if (auto const* v = find_value(m_bools, name)) return *v;
		std::size_t const idx = std::size_t(name & index_mask);
		if (idx >= bool_settings.size()) return false;
		return bool_settings[idx].default_value;
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
			case string_type_base: erase_value(m_strings, name); break;
			case int_type_base: erase_value(m_ints, name); break;
			case bool_type_base: erase_value(m_bools, name); break;
		}
	}
}
