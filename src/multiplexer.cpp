/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/multiplexer.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/assert.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <thread>

namespace curlmux {

namespace {
	// the longest a readiness wait holds the lock. Other threads waiting to
	// stop or add a transfer get in at least this often
	constexpr std::chrono::milliseconds max_wait(1000);
}

int multiplexer::socket_callback(CURL*, curl_socket_t const s, int const what
	, void* clientp, void*)
{
	try
	{
		// Note: it is not allowed to call curl processing functions from
		// inside a curl callback
		auto* self = static_cast<multiplexer*>(clientp);
		if (self == nullptr) return 0;
		self->m_sockets.update(s, static_cast<aux::curl_poll_t>(what));
	}
#if CURLMUX_DEBUG_LIBCURL
	catch (const std::exception& e) {
		std::fprintf(stderr, "multiplexer::socket_callback exception: %s\n", e.what());
	}
#endif
	catch (...)
	{
#if CURLMUX_DEBUG_LIBCURL
		std::fprintf(stderr, "multiplexer::socket_callback unknown exception\n");
#endif
	}
	return 0;
}

int multiplexer::timer_callback(CURLM*, long const timeout_ms, void* clientp)
{
	auto* self = static_cast<multiplexer*>(clientp);
	if (self == nullptr) return 0;
	self->m_sockets.set_timer(timeout_ms);
	return 0;
}

multiplexer::multiplexer(settings_pack const& settings
	, proxy_auth_cache& cache, logger* log)
	: m_settings(settings)
	, m_auth_cache(cache)
	, m_logger(log)
{
	aux::ensure_curl_initialized();
	m_multi = curl_multi_init();
	if (m_multi == nullptr)
		aux::throw_ex<std::runtime_error>("curl_multi_init() returned nullptr");

	try
	{
		aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_SOCKETDATA, this)
			, "curl_multi_setopt(CURLMOPT_SOCKETDATA)");
		aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_SOCKETFUNCTION
			, static_cast<curl_socket_callback>(&multiplexer::socket_callback))
			, "curl_multi_setopt(CURLMOPT_SOCKETFUNCTION)");
		aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_TIMERDATA, this)
			, "curl_multi_setopt(CURLMOPT_TIMERDATA)");
		aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_TIMERFUNCTION
			, static_cast<curl_multi_timer_callback>(&multiplexer::timer_callback))
			, "curl_multi_setopt(CURLMOPT_TIMERFUNCTION)");

		// 0 leaves libcurl's default, which is unlimited
		long const max_total = std::max(0, m_settings.get_int(settings_pack::max_total_connections));
		if (max_total > 0)
		{
			aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_MAX_TOTAL_CONNECTIONS, max_total)
				, "curl_multi_setopt(CURLMOPT_MAX_TOTAL_CONNECTIONS)");
		}
		long const max_host = std::max(0, m_settings.get_int(settings_pack::max_host_connections));
		if (max_host > 0)
		{
			aux::check_multi_returncode(curl_multi_setopt(m_multi, CURLMOPT_MAX_HOST_CONNECTIONS, max_host)
				, "curl_multi_setopt(CURLMOPT_MAX_HOST_CONNECTIONS)");
		}
	}
	catch (...)
	{
		curl_multi_cleanup(m_multi);
		throw;
	}

#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("libcurl %s", curl_version());
#endif
}

multiplexer::~multiplexer()
{
	try
	{
		close();
	}
	catch (std::exception const& e)
	{
		std::fprintf(stderr, "multiplexer::close failed: %s\n", e.what());
	}
}

transfer_env multiplexer::env() const
{
	transfer_env ret;
	ret.auth_cache = &m_auth_cache;
	ret.log = m_logger;
	ret.ca_bundle = m_settings.get_str(settings_pack::ca_bundle);
	ret.user_agent = m_settings.get_str(settings_pack::user_agent);
	ret.verbose_trace = m_settings.get_bool(settings_pack::verbose_trace);
	ret.sanitize_log = m_settings.get_bool(settings_pack::sanitize_log);
	ret.multiplexed = m_settings.get_bool(settings_pack::multiplexed_transfers);
	ret.connect_timeout = m_settings.get_int(settings_pack::connect_timeout);
	return ret;
}

void multiplexer::check_open() const
{
	if (m_multi == nullptr)
		aux::throw_ex<std::logic_error>("multiplexer is closed");
}

void multiplexer::add(transfer& t)
{
	std::lock_guard<std::mutex> l(m_mutex);
	check_open();

	if (t.m_owner == this)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("%s: active transfer", t.key().c_str());
#endif
		return;
	}

	// added to another multiplexer, or in perform()
	if (t.m_owner != nullptr || t.m_context.table != nullptr)
		aux::throw_ex<system_error>(errors::already_registered);

#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("%s: add transfer, transfers = %d", t.key().c_str(), int(m_transfers.size()));
#endif

	if (!m_transfers.insert(t.key(), &t))
		aux::throw_ex<system_error>(errors::already_registered);

	t.m_owner = this;
	t.m_context.table = &m_transfers;

	// libcurl starts a 0 ms timeout to process the new handle
	CURLMcode const ret = curl_multi_add_handle(m_multi, t.handle());
	if (ret != CURLM_OK)
	{
		t.m_owner = nullptr;
		t.m_context.table = nullptr;
		m_transfers.erase(t.key());
		aux::check_multi_returncode(ret, "curl_multi_add_handle");
	}
}

void multiplexer::remove(transfer& t)
{
	std::lock_guard<std::mutex> l(m_mutex);
	remove_impl(t, nullptr);
}

void multiplexer::stop(transfer& t)
{
	std::lock_guard<std::mutex> l(m_mutex);
	remove_impl(t, "Stopped");
}

void multiplexer::remove_impl(transfer& t, char const* reason)
{
	if (t.m_owner != this) return;

	t.mark_done();
	if (reason != nullptr) t.add_error(reason);

#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("%s: remove transfer: %s", t.key().c_str(), t.error_text().c_str());
#endif

	CURLMcode const ret = m_multi != nullptr
		? curl_multi_remove_handle(m_multi, t.handle()) : CURLM_OK;

	m_transfers.erase(t.key());
	t.m_owner = nullptr;
	t.m_context.table = nullptr;

	aux::check_multi_returncode(ret, "curl_multi_remove_handle");
}

void multiplexer::poll_once()
{
	std::lock_guard<std::mutex> l(m_mutex);
	check_open();

	aux::readiness ready;
	std::optional<std::chrono::milliseconds> const timer = m_sockets.timer();
	if (!m_sockets.empty())
	{
		auto const wait = timer ? std::min(*timer, max_wait) : max_wait;
		error_code ec;
		ready = aux::wait_readiness(m_ios, m_sockets.read_interest()
			, m_sockets.write_interest(), m_sockets.any_interest(), wait, ec);
#ifndef CURLMUX_DISABLE_LOGGING
		if (ec) debug_log("readiness wait failed: %s", ec.message().c_str());
#endif
	}
	else if (timer)
	{
		// nothing to wait for but libcurl's clock. This sleeps under the
		// lock, like the readiness wait does
		std::this_thread::sleep_for(std::min(*timer, max_wait));
	}

	drive_impl(ready);
}

void multiplexer::drive(aux::readiness const& ready)
{
	std::lock_guard<std::mutex> l(m_mutex);
	check_open();
	drive_impl(ready);
}

void multiplexer::drive_impl(aux::readiness const& ready)
{
	if (ready.empty())
	{
		// advances libcurl's clock even when nothing happened
		socket_action(CURL_SOCKET_TIMEOUT, 0);
		return;
	}

	for (int const fd : ready.read)
		socket_action(fd, CURL_CSELECT_IN);
	for (int const fd : ready.write)
		socket_action(fd, CURL_CSELECT_OUT);
	for (int const fd : ready.error)
		socket_action(fd, CURL_CSELECT_ERR);
}

void multiplexer::socket_action(curl_socket_t const s, int const ev_bitmask)
{
	int running_handles = 0;
	auto const result = curl_multi_socket_action(m_multi, s, ev_bitmask, &running_handles);
	aux::check_multi_returncode(result, "curl_multi_socket_action");

	// finished transfers stay registered until removed, so this also
	// triggers while any of them is waiting to be picked up
	if (std::size_t(running_handles) != m_transfers.size())
		update_transfers();
}

void multiplexer::update_transfers()
{
	int msgs_in_queue = 0;
	while (CURLMsg* msg = curl_multi_info_read(m_multi, &msgs_in_queue))
	{
		// CURLMSG_DONE is the only message type
		if (msg->msg != CURLMSG_DONE) continue;

		transfer* t = m_transfers.find(aux::handle_key(msg->easy_handle));
		CURLMUX_ASSERT(t != nullptr);
		if (t == nullptr) continue;

		t->complete(msg->data.result);
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("%s: done, result %d, response %ld", t->key().c_str()
			, int(msg->data.result), t->response());
#endif
	}
}

bool multiplexer::do_transfer(transfer& t)
{
	if (t.is_multiplexed())
	{
		add(t);
		auto const interval = std::chrono::milliseconds(
			std::max(0, m_settings.get_int(settings_pack::poll_interval)));
		for (;;)
		{
			if (t.done()) break;
			poll_once();
			std::this_thread::sleep_for(interval);
		}
	}
	else
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("%s: using easy interface", t.key().c_str());
#endif
		t.perform();
	}

	// the easy handle is still attached to the multi handle, and stop()
	// may be appending to the error text from another thread
	std::lock_guard<std::mutex> l(m_mutex);
	finish_transfer(t);
	return t.error_text().empty();
}

void multiplexer::finish_transfer(transfer& t)
{
	switch (t.engine_error())
	{
		case CURLE_URL_MALFORMAT:
			t.m_resp = errors::bad_request;
			t.add_error("URL malformed");
			break;
		case CURLE_UNSUPPORTED_PROTOCOL:
		case CURLE_NOT_BUILT_IN:
			t.m_resp = errors::not_implemented;
			t.add_error("Unsupported protocol, not built-in, or function not found");
			break;
		case CURLE_COULDNT_RESOLVE_PROXY:
		case CURLE_COULDNT_RESOLVE_HOST:
		case CURLE_COULDNT_CONNECT:
			t.m_resp = errors::bad_gateway;
			t.add_error("Could not resolve or connect to proxy or host");
			break;
		case CURLE_OPERATION_TIMEDOUT:
			t.m_resp = errors::gateway_timeout;
			t.add_error("Operation timed out");
			break;
		default:
			break;
	}

	long code = 0;
	if (t.proxy() && t.get_response(code) == CURLE_OK
		&& code == errors::proxy_authentication_required)
	{
		if (t.engine_error() == CURLE_SEND_FAIL_REWIND)
		{
			// libcurl can't resend a streamed body after the challenge.
			// The mechanism is cached now, a retry goes through
			t.m_resp = errors::service_unavailable;
			t.add_error("POST/PUT rewind not supported");
		}
		else if (t.auth())
		{
			std::string out = "Proxy authentication failed: ";
			if (t.user())
				out += "check user/password or try different auth mechanism";
			else
				out += "single sign-on failed, user/password might be required";

			t.m_resp = errors::unauthorized;
			t.add_error(out);

			// don't try this proxy again
			t.auth_cache().mark_failed(*t.proxy());
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("%s: blacklisting proxy %s", t.key().c_str(), t.proxy()->c_str());
#endif
		}
		else
		{
			// the client authenticates with the proxy itself. A CONNECT
			// keeps no error so its connection stays usable for that
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("%s: client to authenticate with upstream proxy", t.key().c_str());
#endif
			if (!t.is_connect())
				t.m_resp = code;
		}
	}

	if (t.is_connect() && !t.socket())
	{
		// the relay needs the connection's socket
		curl_socket_t sock = CURL_SOCKET_BAD;
		CURLcode const ret = t.get_active_socket(sock);
		if (ret == CURLE_OK && sock != CURL_SOCKET_BAD)
		{
			t.m_sock = sock;

			bool used = false;
			CURLcode const proxy_ret = t.get_used_proxy(used);
			if (proxy_ret == CURLE_OK)
				t.m_used_proxy = used;
#ifndef CURLMUX_DISABLE_LOGGING
			else
				debug_log("%s: failed to get used proxy: %s", t.key().c_str()
					, curl_easy_strerror(proxy_ret));
#endif
		}
		else
		{
			std::string const out = "Failed to get active socket: "
				+ std::to_string(int(ret)) + ", " + std::to_string(long(sock));
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("%s: %s", t.key().c_str(), out.c_str());
#endif
			t.add_error(out);
			t.m_resp = errors::service_unavailable;
		}
	}
}

relay_stats multiplexer::relay(transfer& t, int const client_fd)
{
	relay_options opts;
	opts.idle_timeout = std::chrono::seconds(
		std::max(0, m_settings.get_int(settings_pack::tunnel_idle_timeout)));
	opts.chunk_size = m_settings.get_int(settings_pack::tunnel_chunk_size);
	return relay_tunnel(t, client_fd, opts, m_logger);
}

void multiplexer::close()
{
	std::lock_guard<std::mutex> l(m_mutex);
	if (m_multi == nullptr) return;

#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("closing multiplexer");
#endif
	for (transfer* t : m_transfers.all())
		remove_impl(*t, "Stopped");

	// the cleanup may still call the socket callback, m_sockets must be
	// valid until it returns
	if (auto const error = curl_multi_cleanup(m_multi))
		std::fprintf(stderr, "curl_multi_cleanup failed with '%s'\n", curl_multi_strerror(error));
	m_multi = nullptr;
	m_sockets.clear();
}

std::size_t multiplexer::num_transfers() const
{
	return m_transfers.size();
}

std::vector<int> multiplexer::read_interest() const
{
	std::lock_guard<std::mutex> l(m_mutex);
	return m_sockets.read_interest();
}

std::vector<int> multiplexer::write_interest() const
{
	std::lock_guard<std::mutex> l(m_mutex);
	return m_sockets.write_interest();
}

std::optional<std::chrono::milliseconds> multiplexer::timer() const
{
	std::lock_guard<std::mutex> l(m_mutex);
	return m_sockets.timer();
}

#ifndef CURLMUX_DISABLE_LOGGING
bool multiplexer::should_log() const
{
	return m_logger != nullptr && m_logger->should_log();
}

CURLMUX_FORMAT(2,3)
void multiplexer::debug_log(char const* fmt, ...) const
{
	if (!should_log()) return;

	char buf[1024];
	va_list v;
	va_start(v, fmt);
	std::vsnprintf(buf, sizeof(buf), fmt, v);
	va_end(v);
	m_logger->log("multiplexer: %s", buf);
}
#endif
}
