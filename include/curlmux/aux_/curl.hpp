/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_CURL_HPP
#define CURLMUX_CURL_HPP

#include "curlmux/config.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <curl/curl.h>

namespace curlmux::aux {

enum class curl_poll_t : int {
	none   = CURL_POLL_NONE,
	in     = CURL_POLL_IN,
	out    = CURL_POLL_OUT,
	inout  = CURL_POLL_INOUT,
	remove = CURL_POLL_REMOVE,
};
static_assert(CURL_POLL_INOUT == (CURL_POLL_IN | CURL_POLL_OUT));

template<typename T>
struct dependent_false : std::false_type {};

// Making `option` a compile time constant allows curl's typechecker
// to verify the types (it's currently not working for C++)

template<CURLoption option>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const long value)
{
	static_assert(option >= CURLOPTTYPE_LONG && option < CURLOPTTYPE_OBJECTPOINT);
	return curl_easy_setopt(easy_handle, option, value);
}

// char*, function pointers, callback data (void*)
template<CURLoption option, typename T, typename = std::enable_if_t<std::is_pointer_v<T>>>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const T value)
{
	static_assert(option >= CURLOPTTYPE_OBJECTPOINT && option < CURLOPTTYPE_OFF_T);
	return curl_easy_setopt(easy_handle, option, value);
}

template<CURLoption option>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const std::string& value)
{
	static_assert(option >= CURLOPTTYPE_OBJECTPOINT && option < CURLOPTTYPE_FUNCTIONPOINT);
	return curl_easy_setopt_typechecked<option>(easy_handle, value.c_str());
}

template<typename T, CURLINFO info>
CURLcode curl_easy_getinfo_typechecked(CURL* easy_handle, T& value)
{
	using basic_type = std::decay_t<T>;
	constexpr auto info_type = info & CURLINFO_TYPEMASK;

	if constexpr (info_type == CURLINFO_STRING)
	{
		static_assert(std::is_same_v<basic_type, const char *> || std::is_same_v<basic_type, char *>);
	}
	else if constexpr (info_type == CURLINFO_OFF_T)
	{
		static_assert(std::is_same_v<basic_type, curl_off_t>);
	}
	else if constexpr (info_type == CURLINFO_LONG)
	{
		static_assert(std::is_same_v<basic_type, long>);
	}
	else if constexpr (info_type == CURLINFO_SOCKET)
	{
		static_assert(std::is_same_v<basic_type, curl_socket_t>);
	}
	else if constexpr (info_type == CURLINFO_DOUBLE)
	{
		static_assert(std::is_same_v<basic_type, double>);
	}
	else
	{
		// this triggers if new types are added and used.
		static_assert(dependent_false<T>::value);
	}

	return curl_easy_getinfo(easy_handle, info, &value);
}

class curl_easy_error: public std::runtime_error
{
	CURLcode code_;

public:
	curl_easy_error( CURLcode const ec, std::string const & prefix ):
		std::runtime_error( prefix + ": " + curl_easy_strerror(ec) ), code_( ec ) {}

	[[nodiscard]] CURLcode code() const noexcept
	{
		return code_;
	}
};

// calls curl_global_init() exactly once per process and verifies that the
// libcurl loaded at runtime is recent enough. Throws std::runtime_error
// otherwise
CURLMUX_EXTRA_EXPORT void ensure_curl_initialized();

// the string key identifying an easy handle in callback context and in
// handle tables
CURLMUX_EXTRA_EXPORT std::string handle_key(CURL const* easy_handle);

// all CURLM errors are programming errors. Throws std::runtime_error
CURLMUX_EXTRA_EXPORT void check_multi_returncode(CURLMcode result, char const* context);
}

#endif //CURLMUX_CURL_HPP
