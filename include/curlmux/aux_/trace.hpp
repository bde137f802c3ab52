/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_TRACE_HPP_INCLUDED
#define CURLMUX_TRACE_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace curlmux::aux {

	// splits one libcurl trace message into its non-empty lines. Leading and
	// trailing whitespace of the message is dropped
	CURLMUX_EXTRA_EXPORT std::vector<std::string_view> split_trace_lines(std::string_view data);

	// returns ``line`` with the credentials of authorization and
	// authenticate headers, and of libcurl's "Proxy auth using" notice,
	// replaced by their length
	CURLMUX_EXTRA_EXPORT std::string sanitize_trace_line(std::string_view line);
}

#endif
