/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/config.hpp"
#include "curlmux/aux_/string_util.hpp"

#include <algorithm>

namespace curlmux::aux {

	bool is_space(char const c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\r'
			|| c == '\f' || c == '\v';
	}

	char to_lower(char const c)
	{
		return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
	}

	char to_upper(char const c)
	{
		return (c >= 'a' && c <= 'z') ? char(c - 'a' + 'A') : c;
	}

	std::string to_upper(std::string_view const s)
	{
		std::string ret(s);
		for (auto& c : ret) c = to_upper(c);
		return ret;
	}

	bool string_begins_no_case(std::string_view const prefix, std::string_view const s)
	{
		if (s.size() < prefix.size()) return false;
		return string_equal_no_case(prefix, s.substr(0, prefix.size()));
	}

	bool string_equal_no_case(std::string_view const s1, std::string_view const s2)
	{
		if (s1.size() != s2.size()) return false;
		return std::equal(s1.begin(), s1.end(), s2.begin()
			, [] (char const c1, char const c2)
			{ return to_lower(c1) == to_lower(c2); });
	}

	std::string_view strip_string(std::string_view in)
	{
		while (!in.empty() && is_space(in.front()))
			in.remove_prefix(1);

		while (!in.empty() && is_space(in.back()))
			in.remove_suffix(1);
		return in;
	}

	std::string_view nth_token(std::string_view in, int n)
	{
		for (;;)
		{
			while (!in.empty() && is_space(in.front()))
				in.remove_prefix(1);
			if (in.empty()) return {};

			std::size_t end = 0;
			while (end < in.size() && !is_space(in[end]))
				++end;

			if (n == 0) return in.substr(0, end);
			--n;
			in.remove_prefix(end);
		}
	}
}
