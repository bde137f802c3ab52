/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_MULTIPLEXER_HPP_INCLUDED
#define CURLMUX_MULTIPLEXER_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/error_code.hpp"
#include "curlmux/proxy_auth_cache.hpp"
#include "curlmux/settings_pack.hpp"
#include "curlmux/transfer.hpp"
#include "curlmux/tunnel.hpp"
#include "curlmux/aux_/curl.hpp"
#include "curlmux/aux_/socket_io.hpp"
#include "curlmux/aux_/socket_registry.hpp"
#include "curlmux/aux_/throw.hpp"
#include "curlmux/aux_/transfer_table.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace curlmux {

	struct logger;

	// Runs any number of transfers concurrently on one libcurl multi handle.
	//
	// The multiplexer does not own a thread. Callers drive it, either by
	// do_transfer(), which loops until the given transfer is done, or by
	// calling poll_once() themselves. Any number of threads may drive the
	// same multiplexer. Every interaction with libcurl happens under one
	// mutex, so only one of them waits for readiness or runs libcurl at a
	// time.
	//
	// A transfer is added to at most one multiplexer at a time, and must
	// outlive its registration. Destroying a transfer removes it.
	class CURLMUX_EXPORT multiplexer
	{
	public:
		explicit multiplexer(settings_pack const& settings = settings_pack()
			, proxy_auth_cache& cache = proxy_auth_cache::global()
			, logger* log = nullptr);
		~multiplexer();

		multiplexer(multiplexer const&) = delete;
		multiplexer& operator=(multiplexer const&) = delete;

		// the environment to construct transfers with, so they share this
		// multiplexer's auth cache, logger and settings
		transfer_env env() const;

		proxy_auth_cache& auth_cache() const { return m_auth_cache; }
		settings_pack const& settings() const { return m_settings; }

		// sets an option on the multi handle. The socket and timer callback
		// slots are reserved and throw system_error(errors::reserved_option)
		template <typename T>
		void setopt(CURLMoption const option, T const value)
		{
			if (option == CURLMOPT_SOCKETFUNCTION || option == CURLMOPT_SOCKETDATA
				|| option == CURLMOPT_TIMERFUNCTION || option == CURLMOPT_TIMERDATA)
				aux::throw_ex<system_error>(errors::reserved_option);

			std::lock_guard<std::mutex> l(m_mutex);
			check_open();
			aux::check_multi_returncode(curl_multi_setopt(m_multi, option, value)
				, "curl_multi_setopt");
		}

		// registers ``t`` and starts running it. Adding a transfer that is
		// already added to this multiplexer does nothing. Throws
		// system_error(errors::already_registered) if it is added to another
		// one, or is running standalone
		void add(transfer& t);

		// unregisters ``t`` and marks it done. Does nothing if ``t`` isn't
		// added to this multiplexer
		void remove(transfer& t);

		// like remove(), and appends "Stopped" to the transfer's error text.
		// This is how a running transfer is cancelled
		void stop(transfer& t);

		// runs ``t`` to completion, through this multiplexer or standalone
		// depending on t.is_multiplexed(). Afterwards libcurl's result is
		// translated into an HTTP status on the transfer, and a proxy that
		// refused the configured credentials is blacklisted. Returns true if
		// no error was recorded on the transfer. The transfer stays added
		// until it is removed, stopped or destroyed
		bool do_transfer(transfer& t);

		// pumps bytes between the connection of a finished CONNECT transfer
		// and ``client_fd`` until one of them closes or the connection is
		// idle for tunnel_idle_timeout seconds
		relay_stats relay(transfer& t, int client_fd);

		// waits for readiness of libcurl's sockets, bounded by its timer, and
		// feeds the result to drive()
		void poll_once();

		// notifies libcurl of readiness of its sockets. Read readiness is
		// delivered first, then write readiness, then errors. An empty
		// ``ready`` is a timeout
		void drive(aux::readiness const& ready);

		// stops every transfer and releases the multi handle. Nothing can be
		// added afterwards
		void close();

		std::size_t num_transfers() const;
		std::vector<int> read_interest() const;
		std::vector<int> write_interest() const;
		std::optional<std::chrono::milliseconds> timer() const;

	private:
		void check_open() const;
		void remove_impl(transfer& t, char const* reason);
		void drive_impl(aux::readiness const& ready);
		void socket_action(curl_socket_t s, int ev_bitmask);
		void update_transfers();
		void finish_transfer(transfer& t);

		static int socket_callback(CURL* easy, curl_socket_t s, int what
			, void* clientp, void* socketp);
		static int timer_callback(CURLM* multi, long timeout_ms, void* clientp);

#ifndef CURLMUX_DISABLE_LOGGING
		bool should_log() const;
		void debug_log(char const* fmt, ...) const CURLMUX_FORMAT(2,3);
#endif

		// serializes every call into libcurl and access to the members
		// below
		mutable std::mutex m_mutex;

		settings_pack const m_settings;
		proxy_auth_cache& m_auth_cache;
		logger* const m_logger;

		// the reactor readiness waits run on
		boost::asio::io_context m_ios;

		CURLM* m_multi = nullptr;
		aux::socket_registry m_sockets;
		aux::transfer_table m_transfers;
	};
}

#endif
