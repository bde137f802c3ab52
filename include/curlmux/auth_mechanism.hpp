/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_AUTH_MECHANISM_HPP_INCLUDED
#define CURLMUX_AUTH_MECHANISM_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/error_code.hpp"

#include <string_view>

namespace curlmux {

	// translates a proxy authentication mechanism name into the
	// CURLAUTH_* bitmask passed to CURLOPT_PROXYAUTH. Names are matched
	// case-insensitively:
	//
	// ``NONE``
	//	no authentication
	// ``<M>``
	//	exactly mechanism M, e.g. ``NTLM``, ``BASIC``, ``ANY``, ``ANYSAFE``
	// ``NO<M>``
	//	every mechanism, safe or not, except M
	// ``SAFENO<M>``
	//	every safe mechanism except M
	// ``ONLY<M>``
	//	M and nothing else, not even when the proxy offers others
	//
	// unknown names set ``ec`` to errors::invalid_auth_mechanism and
	// return 0
	CURLMUX_EXPORT unsigned long parse_auth_mechanism(std::string_view name, error_code& ec);

	// as above, but throws system_error for unknown names
	CURLMUX_EXPORT unsigned long parse_auth_mechanism(std::string_view name);
}

#endif
