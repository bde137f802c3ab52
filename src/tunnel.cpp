/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/tunnel.hpp"
#include "curlmux/transfer.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/aux_/send_queue.hpp"
#include "curlmux/aux_/socket_io.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <vector>

namespace curlmux {

namespace {

	void erase_fd(std::vector<int>& v, int const fd)
	{
		v.erase(std::remove(v.begin(), v.end(), fd), v.end());
	}

	void insert_fd(std::vector<int>& v, int const fd)
	{
		if (std::find(v.begin(), v.end(), fd) == v.end()) v.push_back(fd);
	}

	bool contains_fd(std::vector<int> const& v, int const fd)
	{
		return std::find(v.begin(), v.end(), fd) != v.end();
	}
}

#ifndef CURLMUX_DISABLE_LOGGING
#define CURLMUX_RELAY_LOG(...) do { \
	if (log != nullptr && log->should_log()) log->log(__VA_ARGS__); } while (false)
#else
#define CURLMUX_RELAY_LOG(...) do {} while (false)
#endif

	std::string tunnel_bootstrap(transfer const& t, bool const used_proxy)
	{
		// only a plain connection to a proxy needs the client's handshake.
		// With tunneling libcurl did the CONNECT itself
		if (!t.is_connect() || t.is_tunnel() || !used_proxy) return {};

		std::string ret = t.method() + " " + t.request_target() + " "
			+ t.http_version() + "\r\n";
		for (auto const& h : t.deferred_headers())
			ret += h.first + ": " + h.second + "\r\n";
		ret += "\r\n";
		return ret;
	}

	relay_stats relay_sockets(int const client_fd, int const tunnel_fd
		, std::string const& bootstrap, relay_options const& options
		, logger* log)
	{
		relay_stats stats;
		error_code ec;

		boost::asio::io_context ios;
		aux::borrowed_descriptor client(ios, client_fd, ec);
		if (ec)
		{
			CURLMUX_RELAY_LOG("client socket: %s", ec.message().c_str());
			return stats;
		}
		aux::borrowed_descriptor tunnel(ios, tunnel_fd, ec);
		if (ec)
		{
			CURLMUX_RELAY_LOG("server socket: %s", ec.message().c_str());
			return stats;
		}

		if (!bootstrap.empty())
		{
			CURLMUX_RELAY_LOG("sending original client headers");
			aux::write_all(tunnel.get(), bootstrap.data(), bootstrap.size(), ec);
			if (ec)
			{
				CURLMUX_RELAY_LOG("failed to send client headers: %s", ec.message().c_str());
				return stats;
			}
		}

		// a full socket buffer leaves the rest queued rather than blocking
		// the other direction
		client.get().non_blocking(true, ec);
		if (!ec) tunnel.get().non_blocking(true, ec);
		if (ec)
		{
			CURLMUX_RELAY_LOG("failed to set non-blocking mode: %s", ec.message().c_str());
			return stats;
		}

		auto desc_for = [&](int const fd) -> aux::descriptor&
		{ return fd == tunnel_fd ? tunnel.get() : client.get(); };
		auto descs = [&](std::vector<int> const& fds)
		{
			std::vector<aux::descriptor*> ret;
			for (int const fd : fds) ret.push_back(&desc_for(fd));
			return ret;
		};

		// a socket leaves rlist once either side closes, and is in wlist
		// only while there is data waiting to be written to it
		std::vector<int> rlist{client_fd, tunnel_fd};
		std::vector<int> wlist;

		aux::send_queue to_client;
		aux::send_queue to_tunnel;
		auto queue_for = [&](int const fd) -> aux::send_queue&
		{ return fd == tunnel_fd ? to_tunnel : to_client; };

		std::vector<char> buf(std::size_t(std::max(options.chunk_size, 1)));
		using clock_type = std::chrono::steady_clock;
		auto deadline = clock_type::now() + options.idle_timeout;

		while (!rlist.empty() || !wlist.empty())
		{
			std::vector<aux::descriptor*> const readers = descs(rlist);
			aux::readiness const ready = aux::wait_readiness(ios, readers, descs(wlist)
				, readers, options.idle_timeout, ec);
			if (ec)
			{
				CURLMUX_RELAY_LOG("wait failed: %s", ec.message().c_str());
				break;
			}
			if (!ready.error.empty())
			{
				CURLMUX_RELAY_LOG("exception, breaking");
				break;
			}

			std::vector<int> outs = ready.write;
			for (int const fd : ready.read)
			{
				// the other side closed in this round
				if (!contains_fd(rlist, fd)) continue;

				bool const from_tunnel = fd == tunnel_fd;
				int const out = from_tunnel ? client_fd : tunnel_fd;
				char const* source = from_tunnel ? "server" : "client";

				std::size_t const n = aux::read_some(desc_for(fd), buf.data(), buf.size(), ec);
				if (ec == boost::asio::error::would_block)
				{
					ec.clear();
					continue;
				}
				if (ec)
				{
					CURLMUX_RELAY_LOG("from %s: %s", source, ec.message().c_str());
					ec.clear();
				}

				if (n > 0)
				{
					stats.bytes_read += std::int64_t(n);
					if (from_tunnel) stats.tunnel_to_client += std::int64_t(n);
					else stats.client_to_tunnel += std::int64_t(n);

					queue_for(out).append(buf.data(), n);
					insert_fd(outs, out);
					deadline = clock_type::now() + options.idle_timeout;
				}
				else
				{
					CURLMUX_RELAY_LOG("connection closed by %s", source);
					// the tunnel is dead once one end closes, nothing more
					// is read from either
					rlist.clear();
					erase_fd(wlist, fd);
					erase_fd(outs, fd);
					queue_for(fd).clear();
				}
			}

			for (int const fd : outs)
			{
				aux::send_queue& q = queue_for(fd);
				if (q.empty())
				{
					erase_fd(wlist, fd);
					continue;
				}

				std::string_view const data = q.front();
				std::size_t const sent = aux::write_some(desc_for(fd), data.data(), data.size(), ec);
				if (ec)
				{
					CURLMUX_RELAY_LOG("sending to %s: %s"
						, fd == tunnel_fd ? "server" : "client", ec.message().c_str());
					ec.clear();
					rlist.clear();
					q.clear();
					erase_fd(wlist, fd);
					continue;
				}

				// a short write leaves the rest at the front of the queue
				q.pop_front(sent);
				stats.bytes_written += std::int64_t(sent);
				if (q.empty()) erase_fd(wlist, fd);
				else insert_fd(wlist, fd);

				if (sent > 0) deadline = clock_type::now() + options.idle_timeout;
			}

			if (clock_type::now() > deadline)
			{
				CURLMUX_RELAY_LOG("connection idle timeout");
				break;
			}
		}

		CURLMUX_RELAY_LOG("%lld bytes read, %lld bytes written"
			, static_cast<long long>(stats.bytes_read)
			, static_cast<long long>(stats.bytes_written));
		return stats;
	}

	relay_stats relay_tunnel(transfer& t, int const client_fd
		, relay_options const& options, logger* log)
	{
		if (!t.socket())
		{
			CURLMUX_RELAY_LOG("%s: cannot relay without an active socket", t.key().c_str());
			return {};
		}

		if (!t.used_proxy())
		{
			CURLMUX_RELAY_LOG("%s: failed to get used proxy", t.key().c_str());
			return {};
		}

		CURLMUX_RELAY_LOG("%s: starting relay", t.key().c_str());
		return relay_sockets(client_fd, int(*t.socket())
			, tunnel_bootstrap(t, *t.used_proxy()), options, log);
	}

#undef CURLMUX_RELAY_LOG
}
