/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/body_stream.hpp"

#include <algorithm>
#include <cstring>

namespace curlmux {

	std::size_t memory_source::read(char* buf, std::size_t const len, error_code& ec)
	{
		ec.clear();
		std::size_t const n = std::min(len, m_data.size() - m_pos);
		if (n > 0) std::memcpy(buf, m_data.data() + m_pos, n);
		m_pos += n;
		return n;
	}

	std::size_t memory_sink::write(char const* buf, std::size_t const len, error_code& ec)
	{
		ec.clear();
		m_data.append(buf, len);
		return len;
	}

	socket_source::socket_source(int const fd)
		: m_desc(m_ios, fd)
	{}

	std::size_t socket_source::read(char* buf, std::size_t const len, error_code& ec)
	{
		return aux::read_some(m_desc.get(), buf, len, ec);
	}

	socket_sink::socket_sink(int const fd)
		: m_desc(m_ios, fd)
	{}

	std::size_t socket_sink::write(char const* buf, std::size_t const len, error_code& ec)
	{
		aux::write_all(m_desc.get(), buf, len, ec);
		if (ec) return 0;
		return len;
	}
}
