/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/proxy_auth_cache.hpp"
#include "curlmux/aux_/string_util.hpp"

namespace curlmux {

	proxy_auth_cache& proxy_auth_cache::global()
	{
		static proxy_auth_cache cache;
		return cache;
	}

	bool proxy_auth_cache::is_failed(std::string const& proxy) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_failed.count(proxy) > 0;
	}

	void proxy_auth_cache::mark_failed(std::string const& proxy)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_failed.insert(proxy);
	}

	std::optional<std::string> proxy_auth_cache::mechanism(std::string const& proxy) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const i = m_mechanisms.find(proxy);
		if (i == m_mechanisms.end()) return std::nullopt;
		return i->second;
	}

	bool proxy_auth_cache::has_mechanism(std::string const& proxy) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_mechanisms.count(proxy) > 0;
	}

	bool proxy_auth_cache::set_mechanism(std::string const& proxy, std::string mechanism)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_mechanisms.emplace(proxy, std::move(mechanism)).second;
	}

	bool proxy_auth_cache::observe_header_line(std::string const& proxy
		, bool const auth_configured, std::string_view const line)
	{
		// the client authenticates by itself, there is nothing to learn
		if (proxy.empty() || !auth_configured) return true;

		std::lock_guard<std::mutex> l(m_mutex);
		if (m_mechanisms.count(proxy) > 0) return true;

		if (!aux::string_begins_no_case("Proxy-Authorization:", line))
			return false;

		// "Proxy-Authorization: NTLM TlRMTVNTUAABAAAA..."
		std::string_view const scheme = aux::nth_token(line, 1);
		if (scheme.empty()) return false;

		m_mechanisms.emplace(proxy, aux::to_upper(scheme));
		return true;
	}

	std::size_t proxy_auth_cache::num_failed() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_failed.size();
	}

	std::size_t proxy_auth_cache::num_mechanisms() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_mechanisms.size();
	}

	void proxy_auth_cache::clear()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_mechanisms.clear();
		m_failed.clear();
	}
}
