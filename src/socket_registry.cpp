/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/socket_registry.hpp"

#include <algorithm>

namespace curlmux::aux {

namespace {

	void add_unique(std::vector<int>& v, int const fd)
	{
		if (std::find(v.begin(), v.end(), fd) == v.end()) v.push_back(fd);
	}

	void remove_all(std::vector<int>& v, int const fd)
	{
		v.erase(std::remove(v.begin(), v.end(), fd), v.end());
	}
}

	void socket_registry::update(curl_socket_t const s, curl_poll_t const what)
	{
		int const fd = int(s);
		switch (what)
		{
			case curl_poll_t::in:
				add_unique(m_rlist, fd);
				remove_all(m_wlist, fd);
				break;
			case curl_poll_t::out:
				remove_all(m_rlist, fd);
				add_unique(m_wlist, fd);
				break;
			case curl_poll_t::inout:
				add_unique(m_rlist, fd);
				add_unique(m_wlist, fd);
				break;
			case curl_poll_t::remove:
			case curl_poll_t::none:
				remove_all(m_rlist, fd);
				remove_all(m_wlist, fd);
				break;
		}
	}

	void socket_registry::set_timer(long const timeout_ms)
	{
		if (timeout_ms < 0)
			m_timer.reset();
		else
			m_timer = std::chrono::milliseconds(timeout_ms);
	}

	std::vector<int> socket_registry::any_interest() const
	{
		std::vector<int> ret = m_rlist;
		for (int const fd : m_wlist) add_unique(ret, fd);
		return ret;
	}

	void socket_registry::clear()
	{
		m_rlist.clear();
		m_wlist.clear();
		m_timer.reset();
	}
}
