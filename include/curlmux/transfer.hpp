/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_TRANSFER_HPP_INCLUDED
#define CURLMUX_TRANSFER_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/aux_/curl.hpp"
#include "curlmux/aux_/memory.hpp"
#include "curlmux/aux_/transfer_table.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace curlmux {

	class multiplexer;
	class proxy_auth_cache;
	struct logger;
	struct body_source;
	struct body_sink;

	// request headers in the order they are sent. Names are compared
	// case-insensitively
	using header_list = std::vector<std::pair<std::string, std::string>>;

	// what a transfer needs from its surroundings. A multiplexer hands out
	// one built from its settings, see multiplexer::env()
	struct transfer_env
	{
		// nullptr selects proxy_auth_cache::global()
		proxy_auth_cache* auth_cache = nullptr;

		// optional, receives the transfer's diagnostics
		logger* log = nullptr;

		// PEM bundle of trusted CAs. Empty selects CURLMUX_CA_BUNDLE
		std::string ca_bundle;

		// sent when the request headers don't carry a User-Agent
		std::string user_agent;

		// install the trace callback. Proxy mechanism discovery needs it
		bool verbose_trace = true;

		// hide credentials in trace lines sent to the logger
		bool sanitize_log = true;

		// run through a multiplexer rather than perform()
		bool multiplexed = true;

		// seconds allowed for connecting, for transfers constructed without
		// an explicit timeout
		int connect_timeout = 60;
	};

	// One outbound HTTP(S) request/response exchange on a libcurl easy
	// handle.
	//
	// A transfer is configured with the set_*() functions, then run either
	// standalone with perform() or by a multiplexer. Once done() is true
	// the outcome (response(), engine_error(), error_text()) stays as it is
	// until reset(), which is the only way to reuse the transfer for another
	// request.
	class CURLMUX_EXPORT transfer
	{
	public:
		explicit transfer(std::string url, std::string method = "GET"
			, std::string http_version = "HTTP/1.1", int connect_timeout = 60
			, transfer_env env = transfer_env());
		transfer(std::string url, std::string method, std::string http_version
			, transfer_env env);
		~transfer();

		transfer(transfer const&) = delete;
		transfer& operator=(transfer const&) = delete;

		// restores every request and runtime attribute to its default and
		// configures the handle for a new request. The transfer must not be
		// added to a multiplexer
		void reset(std::string url, std::string method = "GET"
			, std::string http_version = "HTTP/1.1", int connect_timeout = 60);

		// ask the proxy to tunnel the connection (CONNECT) rather than to
		// forward the request
		void set_tunnel(bool tunnel = true);

		// returns false, without configuring anything, if ``proxy`` failed
		// authentication before. ``noproxy`` is a comma separated list of
		// hosts to reach directly
		[[nodiscard]] bool set_proxy(std::string const& proxy, int port = 0
			, std::optional<std::string> const& noproxy = std::nullopt);

		// proxy credentials. A ``user`` of ":" selects the default
		// credentials of the current user (single sign-on). Call after
		// set_proxy() so a mechanism already negotiated with this proxy is
		// reused. An empty ``auth`` leaves the mechanism unset
		void set_auth(std::string const& user
			, std::optional<std::string> const& password = std::nullopt
			, std::optional<std::string> const& auth = std::string("ANY"));

		// Content-Length sizes PUT and POST uploads and makes PATCH read its
		// body from the body source right away, which must be set first
		void set_headers(header_list const& headers);

		void set_insecure(bool enable = true);
		void set_verbose(bool enable = true);

		// log every trace line, with credentials sanitized, to the logger
		void set_debug(bool enable = true);

		// where the request body comes from and where the response goes.
		// Without a header sink the headers count as already delivered
		void bridge(std::shared_ptr<body_source> source
			, std::shared_ptr<body_sink> body
			, std::shared_ptr<body_sink> headers);

		// bridges to memory: ``data`` as the request body, and in-memory
		// sinks read back with get_data() and get_headers()
		void buffer(std::optional<std::string> data = std::nullopt);

		void set_transfer_decoding(bool enable = false);
		void set_user_agent(std::string const& user_agent);
		void set_follow(bool enable = true);
		void set_multiplexed(bool enable);

		// runs the transfer to completion on the calling thread, outside of
		// any multiplexer. Returns libcurl's result
		CURLcode perform();

		// metadata reported by libcurl. These return its error, if any, and
		// leave the out parameter untouched in that case. For CONNECT the
		// response is the proxy's answer to the CONNECT request
		CURLcode get_response(long& code) const;
		CURLcode get_active_socket(curl_socket_t& sock) const;
		CURLcode get_primary_ip(std::string& ip) const;
		CURLcode get_used_proxy(bool& used) const;

		// what the in-memory sinks set up by buffer() received. Empty when
		// other sinks are used
		std::string get_data() const;
		std::string get_headers() const;

		std::string const& key() const { return m_context.key; }
		CURL* handle() const noexcept { return m_curl_handle.get(); }

		std::string const& url() const { return m_url; }
		std::string const& method() const { return m_method; }
		std::string const& http_version() const { return m_http_version; }
		int connect_timeout() const { return m_connect_timeout; }

		// the request target as given, before CONNECT targets get a scheme
		std::string const& request_target() const { return m_request_target; }

		std::optional<std::string> const& proxy() const { return m_proxy; }
		std::optional<std::string> const& user() const { return m_user; }
		std::optional<std::string> const& auth() const { return m_auth; }
		std::optional<std::int64_t> declared_size() const { return m_size; }

		// headers held back from a plain CONNECT, replayed by the tunnel
		// relay. Empty if none were deferred
		header_list const& deferred_headers() const { return m_deferred_headers; }

		bool is_connect() const { return m_is_connect; }
		bool is_tunnel() const { return m_is_tunnel; }
		bool is_upload() const { return m_is_upload; }
		bool is_post() const { return m_is_post; }
		bool is_patch() const { return m_is_patch; }
		bool is_multiplexed() const { return m_multiplexed; }

		bool sent_headers() const { return m_sent_headers; }
		bool suppressing() const { return m_suppress; }

		bool done() const { return m_done.load(std::memory_order_acquire); }
		long response() const { return m_resp; }
		CURLcode engine_error() const { return m_cerr; }
		std::string const& error_text() const { return m_errstr; }

		// the connection of a CONNECT transfer, once known
		std::optional<curl_socket_t> socket() const { return m_sock; }

		// whether the connection of a CONNECT transfer goes through the
		// proxy, recorded together with socket()
		std::optional<bool> used_proxy() const { return m_used_proxy; }

		proxy_auth_cache& auth_cache() const { return *m_auth_cache; }
		transfer_env const& env() const { return m_env; }

		// the transitions libcurl's read, write, header and trace callbacks
		// drive. Return values follow the libcurl callback contracts
		std::size_t on_read_body(char* buf, std::size_t len);
		std::size_t on_write_body(char const* buf, std::size_t len);
		std::size_t on_write_header(char const* buf, std::size_t len);
		void on_trace(curl_infotype type, char const* data, std::size_t len);

#ifndef CURLMUX_DISABLE_LOGGING
		bool should_log() const;
		void debug_log(char const* fmt, ...) const CURLMUX_FORMAT(2,3);
#endif

	private:
		friend class multiplexer;

		void setup(std::string url, std::string method, std::string http_version
			, int connect_timeout);
		void clear_state();

		// records libcurl's result and marks the transfer done
		void complete(CURLcode result);
		void add_error(std::string_view text);
		void mark_done() { m_done.store(true, std::memory_order_release); }

		template<CURLoption option>
		void setopt(bool value);

		template<CURLoption option, typename T>
		void setopt(const T& value);

		void apply_ca_bundle();
		void apply_http_version(std::string const& version);

		static std::size_t read_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata);
		static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
		static std::size_t header_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
		static int trace_callback(CURL* easy, curl_infotype type, char* data, std::size_t size, void* userdata);

		const aux::unique_ptr_with_deleter<CURL, curl_easy_cleanup> m_curl_handle;
		aux::unique_ptr_with_deleter<curl_slist, curl_slist_free_all> m_headers;

		transfer_env m_env;
		proxy_auth_cache* m_auth_cache;

		// what the callbacks are registered with. Owned here so its address
		// stays valid for the lifetime of the easy handle
		aux::callback_context m_context;

		// the multiplexer this transfer is added to, if any
		multiplexer* m_owner = nullptr;

		std::string m_url;
		std::string m_request_target;
		std::string m_method;
		std::string m_http_version;
		int m_connect_timeout = 60;

		std::optional<std::string> m_proxy;
		std::optional<std::string> m_user;
		std::optional<std::string> m_auth;
		std::optional<std::int64_t> m_size;
		header_list m_deferred_headers;

		std::shared_ptr<body_source> m_source;
		std::shared_ptr<body_sink> m_body_sink;
		std::shared_ptr<body_sink> m_header_sink;

		std::optional<curl_socket_t> m_sock;
		std::optional<bool> m_used_proxy;
		CURLcode m_cerr = CURLE_OK;
		std::string m_errstr;
		long m_resp = 503;
		std::atomic<bool> m_done{false};

		bool m_sent_headers = false;
		bool m_suppress = false;

		bool m_is_connect = false;
		bool m_is_tunnel = false;
		bool m_is_upload = false;
		bool m_is_post = false;
		bool m_is_patch = false;

		bool m_multiplexed = true;
		bool m_debug = false;

		// set once the proxy's mechanism is known, or known not to matter,
		// to stop scanning trace output
		bool m_auth_resolved = false;
	};
}

#endif
