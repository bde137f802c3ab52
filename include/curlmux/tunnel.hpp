/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_TUNNEL_HPP_INCLUDED
#define CURLMUX_TUNNEL_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace curlmux {

	class transfer;
	struct logger;

	// what a relay session moved, for diagnostics
	struct relay_stats
	{
		// bytes received from either side
		std::int64_t bytes_read = 0;

		// bytes sent to either side
		std::int64_t bytes_written = 0;

		std::int64_t client_to_tunnel = 0;
		std::int64_t tunnel_to_client = 0;
	};

	struct relay_options
	{
		// the session ends after this long without any bytes moving
		std::chrono::milliseconds idle_timeout = std::chrono::seconds(30);

		// the most bytes received from one socket at a time
		int chunk_size = 4096;
	};

	// the bytes replayed to a plain (non-tunneling) proxy connection before
	// relaying starts: the client's request line, its deferred headers and
	// the blank line ending them. Empty if nothing needs to be replayed
	CURLMUX_EXPORT std::string tunnel_bootstrap(transfer const& t, bool used_proxy);

	// sends ``bootstrap`` to ``tunnel_fd``, then pumps bytes both ways
	// between the two sockets until one of them closes, either reports an
	// exceptional condition (such as out-of-band data), or neither moves
	// any bytes for options.idle_timeout. Neither socket is closed, both
	// are left in non-blocking mode.
	//
	// Writing to a socket whose peer is gone raises SIGPIPE, as it does for
	// any Boost.Asio descriptor. Applications relaying to peers that may
	// disconnect should ignore it.
	CURLMUX_EXPORT relay_stats relay_sockets(int client_fd, int tunnel_fd
		, std::string const& bootstrap, relay_options const& options
		, logger* log = nullptr);

	// relays between the connection of a completed CONNECT transfer and
	// ``client_fd``. Returns without relaying if the transfer has no socket
	CURLMUX_EXPORT relay_stats relay_tunnel(transfer& t, int client_fd
		, relay_options const& options = relay_options(), logger* log = nullptr);
}

#endif
