/*

Copyright (c) 2012, 2014-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_STRING_UTIL_HPP_INCLUDED
#define CURLMUX_STRING_UTIL_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <string>
#include <string_view>

namespace curlmux::aux {

	// internal
	CURLMUX_EXTRA_EXPORT bool is_space(char c);
	CURLMUX_EXTRA_EXPORT char to_lower(char c);
	CURLMUX_EXTRA_EXPORT char to_upper(char c);
	CURLMUX_EXTRA_EXPORT std::string to_upper(std::string_view s);

	// returns true if s starts with prefix, ignoring ASCII case
	CURLMUX_EXTRA_EXPORT bool string_begins_no_case(std::string_view prefix, std::string_view s);
	CURLMUX_EXTRA_EXPORT bool string_equal_no_case(std::string_view s1, std::string_view s2);
	CURLMUX_EXTRA_EXPORT std::string_view strip_string(std::string_view in);

	// splits on runs of whitespace and returns the n:th token (0-based),
	// or an empty view if there are fewer tokens
	CURLMUX_EXTRA_EXPORT std::string_view nth_token(std::string_view in, int n);
}

#endif // CURLMUX_STRING_UTIL_HPP_INCLUDED
