/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_SEND_QUEUE_HPP_INCLUDED
#define CURLMUX_SEND_QUEUE_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace curlmux::aux {

	// bytes waiting to be written to one side of a tunnel. Data is sent from
	// the front buffer only; a short write leaves the unsent tail of that
	// buffer at the front, ahead of anything appended later
	struct CURLMUX_EXTRA_EXPORT send_queue
	{
		bool empty() const { return m_bytes == 0; }
		std::size_t size() const { return m_bytes; }
		std::size_t num_buffers() const { return m_buffers.size(); }

		void append(char const* buf, std::size_t len);

		// the bytes the next send should attempt
		std::string_view front() const;

		// ``sent`` bytes of front() were written
		void pop_front(std::size_t sent);

		void clear();

	private:
		std::deque<std::string> m_buffers;

		// the number of bytes of m_buffers.front() already sent
		std::size_t m_front_offset = 0;

		// the total number of unsent bytes
		std::size_t m_bytes = 0;
	};
}

#endif
