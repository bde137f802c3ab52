/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/auth_mechanism.hpp"
#include "curlmux/aux_/string_util.hpp"
#include "curlmux/aux_/throw.hpp"

#include <string>

#include <curl/curl.h>

namespace curlmux {

namespace {

	struct mechanism_t
	{
		char const* name;
		unsigned long value;
	};

	mechanism_t const mechanisms[] =
	{
		{"ANY", CURLAUTH_ANY},
		{"ANYSAFE", CURLAUTH_ANYSAFE},
		{"BASIC", CURLAUTH_BASIC},
		{"DIGEST", CURLAUTH_DIGEST},
		{"DIGEST_IE", CURLAUTH_DIGEST_IE},
		{"NEGOTIATE", CURLAUTH_NEGOTIATE},
		{"GSSNEGOTIATE", CURLAUTH_GSSNEGOTIATE},
		{"NTLM", CURLAUTH_NTLM},
		{"NTLM_WB", CURLAUTH_NTLM_WB},
		{"BEARER", CURLAUTH_BEARER},
		{"ONLY", CURLAUTH_ONLY},
	};

	bool lookup(std::string_view const name, unsigned long& out)
	{
		for (auto const& m : mechanisms)
		{
			if (!aux::string_equal_no_case(name, m.name)) continue;
			out = m.value;
			return true;
		}
		return false;
	}
}

	unsigned long parse_auth_mechanism(std::string_view name, error_code& ec)
	{
		ec.clear();
		if (aux::string_equal_no_case(name, "NONE")) return CURLAUTH_NONE;

		unsigned long value = 0;
		if (aux::string_begins_no_case("NO", name))
		{
			name.remove_prefix(2);
			if (lookup(name, value)) return CURLAUTH_ANY & ~value;
		}
		else if (aux::string_begins_no_case("SAFENO", name))
		{
			name.remove_prefix(6);
			if (lookup(name, value)) return CURLAUTH_ANYSAFE & ~value;
		}
		else if (aux::string_begins_no_case("ONLY", name) && name.size() > 4)
		{
			name.remove_prefix(4);
			if (lookup(name, value)) return CURLAUTH_ONLY | value;
		}
		else if (lookup(name, value))
		{
			return value;
		}

		ec = errors::invalid_auth_mechanism;
		return 0;
	}

	unsigned long parse_auth_mechanism(std::string_view const name)
	{
		error_code ec;
		unsigned long const ret = parse_auth_mechanism(name, ec);
		if (ec) aux::throw_ex<system_error>(ec, std::string(name));
		return ret;
	}
}
