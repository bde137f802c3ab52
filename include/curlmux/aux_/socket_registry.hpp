/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_SOCKET_REGISTRY_HPP_INCLUDED
#define CURLMUX_SOCKET_REGISTRY_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/aux_/curl.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace curlmux::aux {

	// the descriptors libcurl currently wants readiness notifications for,
	// and the deadline of its next timeout. Only the multi callbacks mutate
	// it. Not thread safe, the owning multiplexer serializes access
	class CURLMUX_EXTRA_EXPORT socket_registry
	{
	public:
		// applies a CURLMOPT_SOCKETFUNCTION notification. Adding a
		// descriptor that is already present is a no-op
		void update(curl_socket_t s, curl_poll_t what);

		// applies a CURLMOPT_TIMERFUNCTION notification. -1 clears the
		// timer, meaning wait indefinitely
		void set_timer(long timeout_ms);

		std::vector<int> const& read_interest() const { return m_rlist; }
		std::vector<int> const& write_interest() const { return m_wlist; }
		std::optional<std::chrono::milliseconds> timer() const { return m_timer; }

		// the union of both interest sets
		std::vector<int> any_interest() const;

		bool empty() const { return m_rlist.empty() && m_wlist.empty(); }

		void clear();

	private:
		std::vector<int> m_rlist;
		std::vector<int> m_wlist;
		std::optional<std::chrono::milliseconds> m_timer;
	};
}

#endif
