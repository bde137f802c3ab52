/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_ENGINE_INFO_HPP_INCLUDED
#define CURLMUX_ENGINE_INFO_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <string>
#include <vector>

namespace curlmux {

	// the version string of the libcurl loaded at runtime, e.g. "8.5.0"
	CURLMUX_EXPORT std::string engine_version();

	// the names of the features libcurl was built with, e.g. "SSL",
	// "NTLM", "SPNEGO"
	CURLMUX_EXPORT std::vector<std::string> engine_features();

	// the TLS backend libcurl uses, or an empty string
	CURLMUX_EXPORT std::string engine_ssl_version();
}

#endif
