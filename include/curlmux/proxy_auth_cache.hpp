/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_PROXY_AUTH_CACHE_HPP_INCLUDED
#define CURLMUX_PROXY_AUTH_CACHE_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace curlmux {

	// Remembers, per upstream proxy, which authentication mechanism it
	// negotiated and whether authenticating against it failed. Both are
	// properties of the proxy, not of a transfer, so every transfer and
	// multiplexer sharing a cache sees them. All member functions are
	// thread safe.
	//
	// libcurl does not report the mechanism it ended up using, it is
	// recovered from the ``Proxy-Authorization:`` request header in its
	// trace output, see observe_header_line().
	class CURLMUX_EXPORT proxy_auth_cache
	{
	public:
		proxy_auth_cache() = default;
		proxy_auth_cache(proxy_auth_cache const&) = delete;
		proxy_auth_cache& operator=(proxy_auth_cache const&) = delete;

		// the cache shared by everything that isn't given one explicitly
		static proxy_auth_cache& global();

		bool is_failed(std::string const& proxy) const;
		void mark_failed(std::string const& proxy);

		std::optional<std::string> mechanism(std::string const& proxy) const;
		bool has_mechanism(std::string const& proxy) const;

		// records the mechanism for ``proxy`` unless one is cached already.
		// Returns true if it was recorded
		bool set_mechanism(std::string const& proxy, std::string mechanism);

		// feeds one outbound request header line of a transfer going through
		// ``proxy``. ``auth_configured`` is whether that transfer
		// authenticates with the proxy itself. Returns true once the
		// mechanism is known or doesn't need to be, at which point the
		// transfer can stop feeding lines.
		bool observe_header_line(std::string const& proxy, bool auth_configured
			, std::string_view line);

		std::size_t num_failed() const;
		std::size_t num_mechanisms() const;

		void clear();

	private:
		mutable std::mutex m_mutex;

		// proxy -> upper-cased mechanism name, e.g. "NTLM"
		std::map<std::string, std::string> m_mechanisms;

		// proxies that failed authentication
		std::set<std::string> m_failed;
	};
}

#endif
