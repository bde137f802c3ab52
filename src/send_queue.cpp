/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/send_queue.hpp"
#include "curlmux/assert.hpp"

#include <algorithm>

namespace curlmux::aux {

	void send_queue::append(char const* buf, std::size_t const len)
	{
		if (len == 0) return;
		m_buffers.emplace_back(buf, len);
		m_bytes += len;
	}

	std::string_view send_queue::front() const
	{
		if (m_buffers.empty()) return {};
		std::string_view ret = m_buffers.front();
		ret.remove_prefix(m_front_offset);
		return ret;
	}

	void send_queue::pop_front(std::size_t sent)
	{
		CURLMUX_ASSERT(sent <= front().size());
		if (m_buffers.empty()) return;
		sent = std::min(sent, m_buffers.front().size() - m_front_offset);
		m_front_offset += sent;
		m_bytes -= sent;
		if (m_front_offset == m_buffers.front().size())
		{
			m_buffers.pop_front();
			m_front_offset = 0;
		}
	}

	void send_queue::clear()
	{
		m_buffers.clear();
		m_front_offset = 0;
		m_bytes = 0;
	}
}
