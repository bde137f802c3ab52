/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/transfer.hpp"
#include "curlmux/multiplexer.hpp"
#include "curlmux/auth_mechanism.hpp"
#include "curlmux/body_stream.hpp"
#include "curlmux/error_code.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/proxy_auth_cache.hpp"
#include "curlmux/assert.hpp"
#include "curlmux/aux_/string_util.hpp"
#include "curlmux/aux_/throw.hpp"
#include "curlmux/aux_/trace.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>

#include <sys/stat.h>

namespace curlmux {

namespace {

	CURL* create_easy_handle()
	{
		aux::ensure_curl_initialized();
		CURL* const h = curl_easy_init();
		if (h == nullptr)
			aux::throw_ex<std::runtime_error>("curl_easy_init() returned nullptr");
		return h;
	}

	bool file_exists(std::string const& path)
	{
		struct stat st{};
		return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
	}

	void append_header(aux::unique_ptr_with_deleter<curl_slist, curl_slist_free_all>& list
		, std::string const& line)
	{
		curl_slist* const head = curl_slist_append(list.get(), line.c_str());
		if (head == nullptr) aux::throw_ex<std::bad_alloc>();
		// the head only changes when the list was empty
		(void)list.release();
		list.reset(head);
	}

	std::int64_t parse_content_length(std::string const& value)
	{
		char* end = nullptr;
		long long const size = std::strtoll(value.c_str(), &end, 10);
		if (end == value.c_str() || size < 0)
			aux::throw_ex<std::invalid_argument>("invalid Content-Length: " + value);
		return size;
	}

	constexpr std::string_view curl_easy_option_str(CURLoption option) noexcept
	{
		switch (option)
		{
			case CURLOPT_VERBOSE:					return "CURLOPT_VERBOSE";
			case CURLOPT_DEBUGFUNCTION:				return "CURLOPT_DEBUGFUNCTION";
			case CURLOPT_DEBUGDATA:					return "CURLOPT_DEBUGDATA";
			case CURLOPT_READFUNCTION:				return "CURLOPT_READFUNCTION";
			case CURLOPT_READDATA:					return "CURLOPT_READDATA";
			case CURLOPT_WRITEFUNCTION:				return "CURLOPT_WRITEFUNCTION";
			case CURLOPT_WRITEDATA:					return "CURLOPT_WRITEDATA";
			case CURLOPT_HEADERFUNCTION:			return "CURLOPT_HEADERFUNCTION";
			case CURLOPT_HEADERDATA:				return "CURLOPT_HEADERDATA";
			case CURLOPT_SSL_VERIFYPEER:			return "CURLOPT_SSL_VERIFYPEER";
			case CURLOPT_SSL_VERIFYHOST:			return "CURLOPT_SSL_VERIFYHOST";
			case CURLOPT_CAINFO:					return "CURLOPT_CAINFO";
			case CURLOPT_URL:						return "CURLOPT_URL";
			case CURLOPT_USERAGENT:					return "CURLOPT_USERAGENT";
			case CURLOPT_FOLLOWLOCATION:			return "CURLOPT_FOLLOWLOCATION";
			case CURLOPT_NOSIGNAL:					return "CURLOPT_NOSIGNAL";
			case CURLOPT_CONNECTTIMEOUT:			return "CURLOPT_CONNECTTIMEOUT";
			case CURLOPT_CONNECT_ONLY:				return "CURLOPT_CONNECT_ONLY";
			case CURLOPT_HTTPGET:					return "CURLOPT_HTTPGET";
			case CURLOPT_NOBODY:					return "CURLOPT_NOBODY";
			case CURLOPT_POST:						return "CURLOPT_POST";
			case CURLOPT_UPLOAD:					return "CURLOPT_UPLOAD";
			case CURLOPT_CUSTOMREQUEST:				return "CURLOPT_CUSTOMREQUEST";
			case CURLOPT_HTTP_VERSION:				return "CURLOPT_HTTP_VERSION";
			case CURLOPT_HTTP_TRANSFER_DECODING:	return "CURLOPT_HTTP_TRANSFER_DECODING";
			case CURLOPT_HTTPHEADER:				return "CURLOPT_HTTPHEADER";
			case CURLOPT_POSTFIELDSIZE:				return "CURLOPT_POSTFIELDSIZE";
			case CURLOPT_INFILESIZE:				return "CURLOPT_INFILESIZE";
			case CURLOPT_COPYPOSTFIELDS:			return "CURLOPT_COPYPOSTFIELDS";
			case CURLOPT_PROXY:						return "CURLOPT_PROXY";
			case CURLOPT_PROXYPORT:					return "CURLOPT_PROXYPORT";
			case CURLOPT_NOPROXY:					return "CURLOPT_NOPROXY";
			case CURLOPT_HTTPPROXYTUNNEL:			return "CURLOPT_HTTPPROXYTUNNEL";
			case CURLOPT_SUPPRESS_CONNECT_HEADERS:	return "CURLOPT_SUPPRESS_CONNECT_HEADERS";
			case CURLOPT_PROXYUSERPWD:				return "CURLOPT_PROXYUSERPWD";
			case CURLOPT_PROXYUSERNAME:				return "CURLOPT_PROXYUSERNAME";
			case CURLOPT_PROXYPASSWORD:				return "CURLOPT_PROXYPASSWORD";
			case CURLOPT_PROXYAUTH:					return "CURLOPT_PROXYAUTH";
			default:
				return "";
		}
	}

	template<typename T>
	[[noreturn]] void throw_setop_ex(CURLoption option, CURLcode error, const T& value)
	{
		if (error == CURLE_OUT_OF_MEMORY)
			aux::throw_ex<std::bad_alloc>();

		std::string value_str;
		bool value_set = false;

		if (error == CURLE_BAD_FUNCTION_ARGUMENT)
		{
			using basic_type = std::decay_t<T>;

			if constexpr (std::is_integral_v<basic_type>)
			{
				value_str = std::to_string(value);
				value_set = true;
			}
			else if constexpr (std::is_same_v<basic_type, std::string>)
			{
				value_str = value;
				value_set = true;
			}
			else if constexpr (
				std::is_same_v<basic_type, char *> ||
				std::is_same_v<basic_type, const char *>)
			{
				value_str = std::string(value);
				value_set = true;
			}
		}

		if (value_set)
			value_str = " to '" + value_str + "' ";

		auto const option_name = std::string(curl_easy_option_str(option));
		auto context = "setting " + option_name + value_str;
		aux::throw_ex<aux::curl_easy_error>(error, context);
	}
} // anonymous namespace

template<CURLoption option>
void transfer::setopt(bool value)
{
	setopt<option, long>(value ? 1L : 0L);
}

template<CURLoption option, typename T>
void transfer::setopt(const T& value)
{
	// creates a compiler error when the option is not added the str() function
	static_assert(!curl_easy_option_str(option).empty());

	auto error = aux::curl_easy_setopt_typechecked<option>(handle(), value);
	if (!error)
		return;

	throw_setop_ex(option, error, value);
}

std::size_t transfer::read_callback(char* buffer, std::size_t const size
	, std::size_t const nitems, void* userdata)
{
	try
	{
		transfer* t = aux::transfer_from_context(userdata);
		if (t == nullptr) return CURL_READFUNC_ABORT;
		return t->on_read_body(buffer, size * nitems);
	}
#if CURLMUX_DEBUG_LIBCURL
	catch (const std::exception& e) {
		std::fprintf(stderr, "transfer::read_callback exception: %s\n", e.what());
	}
#endif
	catch (...)
	{
#if CURLMUX_DEBUG_LIBCURL
		std::fprintf(stderr, "transfer::read_callback unknown exception\n");
#endif
	}
	// end of body
	return 0;
}

std::size_t transfer::write_callback(char* ptr, std::size_t const size
	, std::size_t const nmemb, void* userdata)
{
	try
	{
		transfer* t = aux::transfer_from_context(userdata);
		if (t == nullptr) return 0;
		return t->on_write_body(ptr, size * nmemb);
	}
#if CURLMUX_DEBUG_LIBCURL
	catch (const std::exception& e) {
		std::fprintf(stderr, "transfer::write_callback exception: %s\n", e.what());
	}
#endif
	catch (...)
	{
#if CURLMUX_DEBUG_LIBCURL
		std::fprintf(stderr, "transfer::write_callback unknown exception\n");
#endif
	}
	// a value different from size * nmemb signals an error
	return 0;
}

std::size_t transfer::header_callback(char* ptr, std::size_t const size
	, std::size_t const nmemb, void* userdata)
{
	try
	{
		transfer* t = aux::transfer_from_context(userdata);
		if (t == nullptr) return 0;
		return t->on_write_header(ptr, size * nmemb);
	}
#if CURLMUX_DEBUG_LIBCURL
	catch (const std::exception& e) {
		std::fprintf(stderr, "transfer::header_callback exception: %s\n", e.what());
	}
#endif
	catch (...)
	{
#if CURLMUX_DEBUG_LIBCURL
		std::fprintf(stderr, "transfer::header_callback unknown exception\n");
#endif
	}
	return 0;
}

int transfer::trace_callback(CURL*, curl_infotype const type, char* data
	, std::size_t const size, void* userdata)
{
	try
	{
		transfer* t = aux::transfer_from_context(userdata);
		if (t != nullptr) t->on_trace(type, data, size);
	}
#if CURLMUX_DEBUG_LIBCURL
	catch (const std::exception& e) {
		std::fprintf(stderr, "transfer::trace_callback exception: %s\n", e.what());
	}
#endif
	catch (...)
	{
#if CURLMUX_DEBUG_LIBCURL
		std::fprintf(stderr, "transfer::trace_callback unknown exception\n");
#endif
	}
	// the return value of the debug callback is ignored by libcurl
	return 0;
}

transfer::transfer(std::string url, std::string method
	, std::string http_version, int const connect_timeout, transfer_env env)
	: m_curl_handle(create_easy_handle())
	, m_env(std::move(env))
	, m_auth_cache(m_env.auth_cache ? m_env.auth_cache : &proxy_auth_cache::global())
	, m_multiplexed(m_env.multiplexed)
{
	m_context.key = aux::handle_key(handle());
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("new transfer");
#endif
	setup(std::move(url), std::move(method), std::move(http_version), connect_timeout);
}

transfer::transfer(std::string url, std::string method
	, std::string http_version, transfer_env env)
	: transfer(std::move(url), std::move(method), std::move(http_version)
		, env.connect_timeout, std::move(env))
{}

transfer::~transfer()
{
	if (m_owner == nullptr) return;
	try
	{
		m_owner->remove(*this);
	}
	catch (std::exception const& e)
	{
		std::fprintf(stderr, "failed to remove transfer %s: %s\n", key().c_str(), e.what());
	}
}

void transfer::setup(std::string url, std::string method, std::string http_version
	, int const connect_timeout)
{
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("%s %s using %s", method.c_str(), url.c_str(), http_version.c_str());
#endif

	// libcurl picks up proxy environment variables (http_proxy, no_proxy ...)
	// unless PROXY is set explicitly. An empty string disables them
	setopt<CURLOPT_PROXY>("");
	setopt<CURLOPT_NOSIGNAL>(true);
	setopt<CURLOPT_CONNECTTIMEOUT, long>(connect_timeout);
	m_connect_timeout = connect_timeout;

	apply_ca_bundle();

	m_request_target = url;
	m_method = method;
	if (method == "CONNECT")
	{
		m_is_connect = true;
		setopt<CURLOPT_CONNECT_ONLY>(true);

		// without a proxy the tunnel is made directly
		set_tunnel();

		// libcurl only makes the plain HTTP connection, the client
		// establishes TLS through it
		if (url.find("://") == std::string::npos)
			url = "http://" + url;
	}
	else if (method == "GET")
	{
		setopt<CURLOPT_HTTPGET>(true);
	}
	else if (method == "HEAD")
	{
		setopt<CURLOPT_NOBODY>(true);
	}
	else if (method == "POST")
	{
		m_is_post = true;
		setopt<CURLOPT_POST>(true);
	}
	else if (method == "PUT")
	{
		m_is_upload = true;
		setopt<CURLOPT_UPLOAD>(true);
	}
	else
	{
		if (method == "PATCH")
			m_is_patch = true;
#ifndef CURLMUX_DISABLE_LOGGING
		else if (method != "DELETE")
			debug_log("unknown method: %s", method.c_str());
#endif
		setopt<CURLOPT_CUSTOMREQUEST>(method);
	}

	m_url = std::move(url);
	setopt<CURLOPT_URL>(m_url);

	apply_http_version(http_version);
	m_http_version = std::move(http_version);

	// the callbacks are always installed, a missing sink means discard
	// rather than libcurl's stdin and stdout defaults
	void* const ctx = &m_context;
	setopt<CURLOPT_READFUNCTION, curl_read_callback>(read_callback);
	setopt<CURLOPT_READDATA>(ctx);
	setopt<CURLOPT_WRITEFUNCTION, curl_write_callback>(write_callback);
	setopt<CURLOPT_WRITEDATA>(ctx);
	setopt<CURLOPT_HEADERFUNCTION, curl_write_callback>(header_callback);
	setopt<CURLOPT_HEADERDATA>(ctx);

	if (m_env.verbose_trace)
	{
		// the trace is the only place libcurl reveals the proxy
		// authentication mechanism it negotiated
		setopt<CURLOPT_DEBUGFUNCTION, curl_debug_callback>(trace_callback);
		setopt<CURLOPT_DEBUGDATA>(ctx);
		set_verbose();
	}

	if (!m_env.user_agent.empty())
		set_user_agent(m_env.user_agent);
}

void transfer::apply_ca_bundle()
{
#ifndef CURLMUX_WINDOWS
	// on windows libcurl uses schannel, which uses the system store
	std::string const bundle = m_env.ca_bundle.empty()
		? std::string(CURLMUX_CA_BUNDLE) : m_env.ca_bundle;
	if (bundle.empty() || !file_exists(bundle))
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("no CA bundle at \"%s\", using the engine default", bundle.c_str());
#endif
		return;
	}

#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("using CAINFO from %s", bundle.c_str());
#endif
	setopt<CURLOPT_CAINFO>(bundle);
#endif
}

void transfer::apply_http_version(std::string const& version)
{
	// "HTTP/1.1" -> "1.1"
	auto const slash = version.find('/');
	std::string_view const v = slash == std::string::npos
		? std::string_view() : std::string_view(version).substr(slash + 1);

	long value = CURL_HTTP_VERSION_NONE;
	if (v == "1.0") value = CURL_HTTP_VERSION_1_0;
	else if (v == "1.1") value = CURL_HTTP_VERSION_1_1;
	else if (v == "2" || v == "2.0") value = CURL_HTTP_VERSION_2_0;
#if LIBCURL_VERSION_NUM >= 0x074200
	else if (v == "3" || v == "3.0") value = CURL_HTTP_VERSION_3;
#endif
	else
		aux::throw_ex<std::invalid_argument>("unsupported HTTP version: " + version);

	setopt<CURLOPT_HTTP_VERSION>(value);
}

void transfer::clear_state()
{
	m_sock.reset();
	m_used_proxy.reset();

	m_source.reset();
	m_body_sink.reset();
	m_header_sink.reset();

	m_proxy.reset();
	m_user.reset();
	m_auth.reset();
	m_size.reset();
	m_deferred_headers.clear();

	m_cerr = CURLE_OK;
	m_errstr.clear();
	m_resp = 503;
	m_done.store(false, std::memory_order_release);
	m_sent_headers = false;
	m_suppress = false;

	m_is_connect = false;
	m_is_tunnel = false;
	m_is_upload = false;
	m_is_post = false;
	m_is_patch = false;

	m_multiplexed = m_env.multiplexed;
	m_debug = false;
	m_auth_resolved = false;

	m_headers.reset();
}

void transfer::reset(std::string url, std::string method
	, std::string http_version, int const connect_timeout)
{
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("resetting");
#endif
	if (m_owner != nullptr) m_owner->remove(*this);

	curl_easy_reset(handle());
	clear_state();
	setup(std::move(url), std::move(method), std::move(http_version), connect_timeout);
}

void transfer::set_tunnel(bool const tunnel)
{
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("HTTP proxy tunneling = %s", tunnel ? "true" : "false");
#endif
	setopt<CURLOPT_HTTPPROXYTUNNEL>(tunnel);
	setopt<CURLOPT_SUPPRESS_CONNECT_HEADERS>(tunnel);
	m_is_tunnel = tunnel;
}

bool transfer::set_proxy(std::string const& proxy, int const port
	, std::optional<std::string> const& noproxy)
{
	if (m_auth_cache->is_failed(proxy))
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("authentication with proxy %s failed before", proxy.c_str());
#endif
		return false;
	}

	m_proxy = proxy;
	setopt<CURLOPT_PROXY>(proxy);
	setopt<CURLOPT_PROXYPORT, long>(port);
	if (noproxy)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("noproxy: %s", noproxy->c_str());
#endif
		setopt<CURLOPT_NOPROXY>(*noproxy);
	}

	// a proxy but no auth (yet). Just connect and let the client
	// authenticate with the proxy through the tunnel
	if (m_is_connect)
		set_tunnel(false);

	return true;
}

void transfer::set_auth(std::string const& user
	, std::optional<std::string> const& password
	, std::optional<std::string> const& auth)
{
	if (user == ":")
	{
		setopt<CURLOPT_PROXYUSERPWD>(user);
	}
	else
	{
		m_user = user;
		setopt<CURLOPT_PROXYUSERNAME>(user);
		if (password)
			setopt<CURLOPT_PROXYPASSWORD>(*password);
#ifndef CURLMUX_DISABLE_LOGGING
		else
			debug_log("blank password for user");
#endif
	}

	if (!auth || auth->empty()) return;

	std::optional<std::string> const cached = m_proxy
		? m_auth_cache->mechanism(*m_proxy) : std::nullopt;
	if (cached)
	{
		m_auth = *cached;
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("using cached proxy auth mechanism %s", m_auth->c_str());
#endif
	}
	else
	{
		m_auth = *auth;
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("setting proxy auth mechanism to %s", m_auth->c_str());
#endif
	}

	setopt<CURLOPT_PROXYAUTH, long>(static_cast<long>(parse_auth_mechanism(*m_auth)));

	// proxy and auth, tunnel and authenticate
	if (m_is_connect)
		set_tunnel();
}

void transfer::set_headers(header_list const& headers)
{
	aux::unique_ptr_with_deleter<curl_slist, curl_slist_free_all> list;
	bool const skip_proxy_headers = m_proxy.has_value() && m_auth.has_value();

	for (auto const& h : headers)
	{
		std::string const& name = h.first;
		std::string const& value = h.second;

		if (skip_proxy_headers && aux::string_begins_no_case("proxy-", name))
		{
			// the proxy is authenticated with here, the client's proxy
			// headers must not reach it
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("skipping header =!> %s", aux::sanitize_trace_line(name + ": " + value).c_str());
#endif
			continue;
		}

		if (aux::string_equal_no_case(name, "content-length"))
		{
			std::int64_t const size = parse_content_length(value);
			if (m_is_upload || m_is_post)
			{
				// the size is known, turn off chunked encoding and the
				// 100-continue handshake
				m_size = size;
				append_header(list, "Transfer-Encoding:");
				append_header(list, "Expect:");
				if (m_is_post)
					setopt<CURLOPT_POSTFIELDSIZE, long>(static_cast<long>(size));
				else
					setopt<CURLOPT_INFILESIZE, long>(static_cast<long>(size));
			}
			else if (m_is_patch)
			{
				// libcurl doesn't use the read callback for custom
				// requests, the body is read up front
				if (!m_source)
					aux::throw_ex<std::logic_error>("a PATCH body requires bridge() or buffer() before set_headers()");

				std::string body(static_cast<std::size_t>(size), '\0');
				std::size_t got = 0;
				while (got < body.size())
				{
					error_code ec;
					std::size_t const n = m_source->read(&body[got], body.size() - got, ec);
					if (ec) aux::throw_ex<system_error>(ec);
					if (n == 0) break;
					got += n;
				}
				body.resize(got);
				setopt<CURLOPT_POSTFIELDSIZE, long>(static_cast<long>(body.size()));
				setopt<CURLOPT_COPYPOSTFIELDS>(body);
			}
		}
		else if (aux::string_equal_no_case(name, "user-agent"))
		{
			set_user_agent(value);
			continue;
		}

		std::string line = name + ": " + value;
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("adding header => %s", aux::sanitize_trace_line(line).c_str());
#endif
		append_header(list, line);
	}

	if (headers.empty()) return;

	if (m_is_connect && !m_is_tunnel)
	{
		// libcurl only connects to the proxy in this mode, the client's
		// headers are replayed over the raw socket by the tunnel relay
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("deferring headers");
#endif
		m_deferred_headers = headers;
	}
	else
	{
		setopt<CURLOPT_HTTPHEADER>(list.get());
	}
	m_headers = std::move(list);
}

void transfer::set_insecure(bool const enable)
{
	setopt<CURLOPT_SSL_VERIFYPEER>(!enable);
	setopt<CURLOPT_SSL_VERIFYHOST, long>(enable ? 0L : 2L);
}

void transfer::set_verbose(bool const enable)
{
	setopt<CURLOPT_VERBOSE>(enable);
}

void transfer::set_debug(bool const enable)
{
	m_debug = enable;
}

void transfer::bridge(std::shared_ptr<body_source> source
	, std::shared_ptr<body_sink> body
	, std::shared_ptr<body_sink> headers)
{
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("setting up bridge");
#endif
	if (source) m_source = std::move(source);
	if (body) m_body_sink = std::move(body);
	if (headers) m_header_sink = std::move(headers);
	else m_sent_headers = true;
}

void transfer::buffer(std::optional<std::string> data)
{
	std::shared_ptr<body_source> source;
	if (data) source = std::make_shared<memory_source>(std::move(*data));
	bridge(std::move(source), std::make_shared<memory_sink>(), std::make_shared<memory_sink>());
}

void transfer::set_transfer_decoding(bool const enable)
{
	setopt<CURLOPT_HTTP_TRANSFER_DECODING>(enable);
}

void transfer::set_user_agent(std::string const& user_agent)
{
	if (user_agent.empty()) return;
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("setting user agent to %s", user_agent.c_str());
#endif
	setopt<CURLOPT_USERAGENT>(user_agent);
}

void transfer::set_follow(bool const enable)
{
	setopt<CURLOPT_FOLLOWLOCATION>(enable);
}

void transfer::set_multiplexed(bool const enable)
{
	m_multiplexed = enable;
}

CURLcode transfer::perform()
{
	if (m_owner != nullptr)
		aux::throw_ex<system_error>(errors::already_registered);

	auto& table = aux::transfer_table::standalone();
	if (!table.insert(key(), this))
		aux::throw_ex<system_error>(errors::already_registered);

	m_context.table = &table;
	CURLcode const result = curl_easy_perform(handle());
	m_context.table = nullptr;
	table.erase(key());

	complete(result);
	return result;
}

void transfer::complete(CURLcode const result)
{
	// stopped transfers keep the outcome they were stopped with
	if (done()) return;

	m_cerr = result;
	if (result != CURLE_OK)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("connection failed: %d; %s", int(result), curl_easy_strerror(result));
#endif
		add_error("curl error " + std::to_string(int(result)) + ": " + curl_easy_strerror(result));
	}
	else
	{
		long code = 0;
		if (get_response(code) == CURLE_OK)
		{
			// a CONNECT to a proxy without tunneling involves no HTTP
			// exchange
			if (code == 0 && m_is_connect) m_resp = errors::ok;
			else if (code != 0) m_resp = code;
		}
	}
	mark_done();
}

void transfer::add_error(std::string_view const text)
{
	m_errstr.append(text.data(), text.size());
	m_errstr += "; ";
}

CURLcode transfer::get_response(long& code) const
{
	if (m_is_connect)
		return aux::curl_easy_getinfo_typechecked<long, CURLINFO_HTTP_CONNECTCODE>(handle(), code);
	return aux::curl_easy_getinfo_typechecked<long, CURLINFO_RESPONSE_CODE>(handle(), code);
}

CURLcode transfer::get_active_socket(curl_socket_t& sock) const
{
	return aux::curl_easy_getinfo_typechecked<curl_socket_t, CURLINFO_ACTIVESOCKET>(handle(), sock);
}

CURLcode transfer::get_primary_ip(std::string& ip) const
{
	char* value = nullptr;
	CURLcode const ret = aux::curl_easy_getinfo_typechecked<char*, CURLINFO_PRIMARY_IP>(handle(), value);
	if (ret == CURLE_OK) ip = value ? value : "";
	return ret;
}

CURLcode transfer::get_used_proxy(bool& used) const
{
#if LIBCURL_VERSION_NUM >= 0x080700
	long value = 0;
	CURLcode const ret = aux::curl_easy_getinfo_typechecked<long, CURLINFO_USED_PROXY>(handle(), value);
	if (ret == CURLE_OK) used = value != 0;
	return ret;
#else
	// older libcurl can't tell, a configured proxy is used unless noproxy
	// matched
	used = m_proxy.has_value() && !m_proxy->empty();
	return CURLE_OK;
#endif
}

std::string transfer::get_data() const
{
	auto const* sink = dynamic_cast<memory_sink const*>(m_body_sink.get());
	if (sink == nullptr) return {};
	return sink->data();
}

std::string transfer::get_headers() const
{
	auto const* sink = dynamic_cast<memory_sink const*>(m_header_sink.get());
	if (sink == nullptr) return {};
	return sink->data();
}

std::size_t transfer::on_read_body(char* buf, std::size_t len)
{
	if (!m_size)
	{
		// no declared body, or all of it was served
		return 0;
	}

	if (*m_size > static_cast<std::int64_t>(len))
	{
		*m_size -= static_cast<std::int64_t>(len);
	}
	else
	{
		len = static_cast<std::size_t>(*m_size);
		m_size.reset();
	}

	if (!m_source)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("read expected but no body source");
#endif
		return 0;
	}

	std::size_t got = 0;
	while (got < len)
	{
		error_code ec;
		std::size_t const n = m_source->read(buf + got, len - got, ec);
		if (ec)
		{
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("error reading from client: %s", ec.message().c_str());
#endif
			return 0;
		}
		if (n == 0) break;
		got += n;
	}
#ifndef CURLMUX_DISABLE_LOGGING
	debug_log("read %d bytes", int(got));
#endif
	return got;
}

std::size_t transfer::on_write_body(char const* buf, std::size_t const len)
{
	if (len == 0) return 0;

	if (!m_sent_headers)
	{
		// the body of a response whose headers were withheld, e.g. a 407
		// challenge
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("skipped %d bytes", int(len));
#endif
		return len;
	}

	if (!m_body_sink)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("ignored %d bytes", int(len));
#endif
		return len;
	}

	error_code ec;
	std::size_t const n = m_body_sink->write(buf, len, ec);
	if (ec)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("error writing to client: %s", ec.message().c_str());
#endif
		return 0;
	}
	return n;
}

std::size_t transfer::on_write_header(char const* buf, std::size_t const len)
{
	if (len == 0) return 0;

	std::string_view const line(buf, len);
	if (m_suppress)
	{
		if (line == "\r\n")
		{
#ifndef CURLMUX_DISABLE_LOGGING
			debug_log("resuming headers");
#endif
			m_suppress = false;
		}
		return len;
	}

	if (line == "\r\n")
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("done sending headers");
#endif
		m_sent_headers = true;
	}
	else if (m_auth && line.front() == 'H' && line.find("407") != std::string_view::npos)
	{
		// "HTTP/1.1 407 Proxy Authentication Required". The proxy is
		// authenticated with here, its challenge must not reach the client
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("suppressing headers");
#endif
		m_suppress = true;
		return len;
	}

	if (!m_header_sink)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("ignored %d bytes", int(len));
#endif
		return len;
	}

	error_code ec;
	std::size_t const n = m_header_sink->write(buf, len, ec);
	if (ec)
	{
#ifndef CURLMUX_DISABLE_LOGGING
		debug_log("error writing header to client: %s", ec.message().c_str());
#endif
		return 0;
	}
	return n;
}

void transfer::on_trace(curl_infotype const type, char const* data, std::size_t const len)
{
	char const* prefix = nullptr;
	switch (type)
	{
		case CURLINFO_TEXT: prefix = "curl info: "; break;
		case CURLINFO_HEADER_IN: prefix = "received header <= "; break;
		case CURLINFO_HEADER_OUT: prefix = "sent header => "; break;
		default: return;
	}

	bool const scrape = type == CURLINFO_HEADER_OUT && !m_auth_resolved;
#ifndef CURLMUX_DISABLE_LOGGING
	bool const log_lines = m_debug && should_log();
#else
	bool const log_lines = false;
#endif
	if (!scrape && !log_lines) return;

	for (std::string_view const line : aux::split_trace_lines(std::string_view(data, len)))
	{
#ifndef CURLMUX_DISABLE_LOGGING
		if (log_lines)
		{
			std::string const text = m_env.sanitize_log
				? aux::sanitize_trace_line(line) : std::string(line);
			debug_log("%s%s", prefix, text.c_str());
		}
#endif
		if (scrape && !m_auth_resolved
			&& m_auth_cache->observe_header_line(m_proxy.value_or(std::string())
				, m_auth.has_value(), line))
		{
#ifndef CURLMUX_DISABLE_LOGGING
			if (m_proxy && m_auth)
			{
				auto const mech = m_auth_cache->mechanism(*m_proxy);
				debug_log("proxy auth mechanism for %s is %s", m_proxy->c_str()
					, mech ? mech->c_str() : "unknown");
			}
#endif
			m_auth_resolved = true;
			if (!log_lines) break;
		}
	}
	(void)prefix;
}

#ifndef CURLMUX_DISABLE_LOGGING
bool transfer::should_log() const
{
	return m_env.log != nullptr && m_env.log->should_log();
}

CURLMUX_FORMAT(2,3)
void transfer::debug_log(char const* fmt, ...) const
{
	if (!should_log()) return;

	char buf[1024];
	va_list v;
	va_start(v, fmt);
	std::vsnprintf(buf, sizeof(buf), fmt, v);
	va_end(v);
	m_env.log->log("%s: %s", key().c_str(), buf);
}
#endif
}
