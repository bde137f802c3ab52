/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/trace.hpp"
#include "curlmux/aux_/string_util.hpp"

namespace curlmux::aux {

namespace {

	std::string lowered(std::string_view const s)
	{
		std::string ret(s);
		for (auto& c : ret) c = to_lower(c);
		return ret;
	}

	std::string hide_after(std::string_view const line, std::size_t const pos)
	{
		std::string ret(line.substr(0, pos));
		ret += " sanitized len(";
		ret += std::to_string(line.size() - pos);
		ret += ")";
		return ret;
	}
}

	std::vector<std::string_view> split_trace_lines(std::string_view data)
	{
		std::vector<std::string_view> ret;
		data = strip_string(data);
		while (!data.empty())
		{
			auto const pos = data.find("\r\n");
			std::string_view const line = data.substr(0, pos);
			if (!line.empty()) ret.push_back(line);
			if (pos == std::string_view::npos) break;
			data.remove_prefix(pos + 2);
		}
		return ret;
	}

	std::string sanitize_trace_line(std::string_view const line)
	{
		std::string const lower = lowered(line);
		if (lower.find("authorization: ") != std::string::npos
			|| lower.find("authenticate: ") != std::string::npos)
		{
			// keep the header name and the scheme
			auto const first = lower.find(' ');
			if (first != std::string::npos)
			{
				auto const second = lower.find(' ', first + 1);
				if (second != std::string::npos) return hide_after(line, second);
			}
		}
		else if (lower.compare(0, 17, "proxy auth using ") == 0)
		{
			auto const space = lower.find(' ', 17);
			if (space != std::string::npos) return hide_after(line, space);
		}
		return std::string(line);
	}
}
