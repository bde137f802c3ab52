/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/curl.hpp"
#include "curlmux/aux_/throw.hpp"
#include "curlmux/assert.hpp"
#include "curlmux/engine_info.hpp"

#include <cinttypes>
#include <cstdio>
#include <mutex>

namespace curlmux::aux {

namespace {
	// the oldest libcurl the build accepts. CURLOPT_SUPPRESS_CONNECT_HEADERS
	// (7.54.1) and CURLINFO_ACTIVESOCKET (7.45) are required
	constexpr unsigned int min_curl_version = 0x073e00;
	static_assert(LIBCURL_VERSION_NUM >= min_curl_version, "libcurl 7.62 or later is required");
}

void ensure_curl_initialized()
{
	static std::once_flag init_flag;
	std::call_once(init_flag, [] {
		auto const ret = curl_global_init(CURL_GLOBAL_ALL);
		if (ret != CURLE_OK)
			throw_ex<curl_easy_error>(ret, "curl_global_init");

		auto const* ver = curl_version_info(CURLVERSION_NOW);
		if (ver == nullptr || ver->version_num < min_curl_version)
		{
			throw_ex<std::runtime_error>(std::string("libcurl version too old: ")
				+ (ver ? ver->version : "unknown"));
		}
	});
}

std::string handle_key(CURL const* easy_handle)
{
	char buf[2 + 2 * sizeof(void*) + 1];
	std::snprintf(buf, sizeof(buf), "%" PRIxPTR, reinterpret_cast<std::uintptr_t>(easy_handle));
	return buf;
}

void check_multi_returncode(CURLMcode const result, char const* context)
{
	CURLMUX_ASSERT(result == CURLM_OK);
	if (result != CURLM_OK)
	{
		auto message = std::string(context) + ": " + curl_multi_strerror(result);

		// CURLM errors are programming errors. errors related to the network
		// are returned on the easy handles
		throw_ex<std::runtime_error>(message);
	}
}
}

namespace curlmux {

std::string engine_version()
{
	auto const* ver = curl_version_info(CURLVERSION_NOW);
	if (ver == nullptr || ver->version == nullptr) return {};
	return ver->version;
}

std::string engine_ssl_version()
{
	auto const* ver = curl_version_info(CURLVERSION_NOW);
	if (ver == nullptr || ver->ssl_version == nullptr) return {};
	return ver->ssl_version;
}

std::vector<std::string> engine_features()
{
	std::vector<std::string> ret;
	auto const* ver = curl_version_info(CURLVERSION_NOW);
	if (ver == nullptr) return ret;

	struct feature_t { int bit; char const* name; };
	static feature_t const features[] =
	{
		{CURL_VERSION_IPV6, "IPV6"},
		{CURL_VERSION_SSL, "SSL"},
		{CURL_VERSION_LIBZ, "LIBZ"},
		{CURL_VERSION_NTLM, "NTLM"},
		{CURL_VERSION_GSSNEGOTIATE, "GSSNEGOTIATE"},
		{CURL_VERSION_DEBUG, "DEBUG"},
		{CURL_VERSION_ASYNCHDNS, "ASYNCHDNS"},
		{CURL_VERSION_SPNEGO, "SPNEGO"},
		{CURL_VERSION_LARGEFILE, "LARGEFILE"},
		{CURL_VERSION_IDN, "IDN"},
		{CURL_VERSION_SSPI, "SSPI"},
		{CURL_VERSION_CONV, "CONV"},
		{CURL_VERSION_CURLDEBUG, "CURLDEBUG"},
		{CURL_VERSION_TLSAUTH_SRP, "TLSAUTH_SRP"},
		{CURL_VERSION_NTLM_WB, "NTLM_WB"},
		{CURL_VERSION_HTTP2, "HTTP2"},
		{CURL_VERSION_GSSAPI, "GSSAPI"},
		{CURL_VERSION_KERBEROS5, "KERBEROS5"},
		{CURL_VERSION_UNIX_SOCKETS, "UNIX_SOCKETS"},
		{CURL_VERSION_PSL, "PSL"},
		{CURL_VERSION_HTTPS_PROXY, "HTTPS_PROXY"},
		{CURL_VERSION_MULTI_SSL, "MULTI_SSL"},
		{CURL_VERSION_BROTLI, "BROTLI"},
#if LIBCURL_VERSION_NUM >= 0x074000
		{CURL_VERSION_ALTSVC, "ALTSVC"},
#endif
#if LIBCURL_VERSION_NUM >= 0x074200
		{CURL_VERSION_HTTP3, "HTTP3"},
#endif
#if LIBCURL_VERSION_NUM >= 0x074800
		{CURL_VERSION_ZSTD, "ZSTD"},
		{CURL_VERSION_UNICODE, "UNICODE"},
#endif
#if LIBCURL_VERSION_NUM >= 0x074a00
		{CURL_VERSION_HSTS, "HSTS"},
#endif
#if LIBCURL_VERSION_NUM >= 0x074c00
		{CURL_VERSION_GSASL, "GSASL"},
#endif
	};

	for (auto const& f : features)
	{
		if (ver->features & f.bit) ret.emplace_back(f.name);
	}
	return ret;
}
}
