/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "curlmux/aux_/string_util.hpp"
#include "curlmux/aux_/trace.hpp"

#include <string_view>

using namespace curlmux;
using namespace curlmux::aux;

CURLMUX_TEST(is_space)
{
	TEST_CHECK(!is_space('C'));
	TEST_CHECK(!is_space('\b'));
	TEST_CHECK(!is_space('8'));
	TEST_CHECK(!is_space('='));
	TEST_CHECK(is_space(' '));
	TEST_CHECK(is_space('\t'));
	TEST_CHECK(is_space('\n'));
	TEST_CHECK(is_space('\r'));
	TEST_CHECK(is_space('\f'));
	TEST_CHECK(is_space('\v'));
}

CURLMUX_TEST(to_lower)
{
	TEST_CHECK(to_lower('C') == 'c');
	TEST_CHECK(to_lower('c') == 'c');
	TEST_CHECK(to_lower('-') == '-');
	TEST_CHECK(to_lower('&') == '&');
}

CURLMUX_TEST(to_upper)
{
	TEST_CHECK(to_upper('n') == 'N');
	TEST_CHECK(to_upper('N') == 'N');
	TEST_CHECK(to_upper('_') == '_');
	TEST_EQUAL(to_upper("Negotiate"), "NEGOTIATE");
	TEST_EQUAL(to_upper(""), "");
}

CURLMUX_TEST(string_equal_no_case)
{
	TEST_CHECK(string_equal_no_case("foobar", "FoobAR"));
	TEST_CHECK(string_equal_no_case("foobar", "foobar"));
	TEST_CHECK(!string_equal_no_case("foobar", "foobac"));
	TEST_CHECK(!string_equal_no_case("foobar", "foo"));
	TEST_CHECK(string_equal_no_case("", ""));
}

CURLMUX_TEST(string_begins_no_case)
{
	TEST_CHECK(string_begins_no_case("proxy-", "Proxy-Authorization"));
	TEST_CHECK(string_begins_no_case("Proxy-Authorization:", "proxy-authorization: NTLM abc"));
	TEST_CHECK(!string_begins_no_case("proxy-", "Host"));
	TEST_CHECK(!string_begins_no_case("proxy-", "prox"));
	TEST_CHECK(string_begins_no_case("", "anything"));
}

CURLMUX_TEST(strip_string)
{
	TEST_EQUAL(strip_string("  a b \r\n"), "a b");
	TEST_EQUAL(strip_string("\r\n"), "");
	TEST_EQUAL(strip_string("abc"), "abc");
}

CURLMUX_TEST(nth_token)
{
	std::string_view const line = "Proxy-Authorization:  NTLM\tTlRMTVNTUAABAAAA";
	TEST_EQUAL(nth_token(line, 0), "Proxy-Authorization:");
	TEST_EQUAL(nth_token(line, 1), "NTLM");
	TEST_EQUAL(nth_token(line, 2), "TlRMTVNTUAABAAAA");
	TEST_EQUAL(nth_token(line, 3), "");
	TEST_EQUAL(nth_token("   ", 0), "");
}

CURLMUX_TEST(split_trace_lines)
{
	auto const lines = split_trace_lines("GET / HTTP/1.1\r\nHost: a\r\n\r\n");
	TEST_EQUAL(lines.size(), 2);
	if (lines.size() != 2) return;
	TEST_EQUAL(lines[0], "GET / HTTP/1.1");
	TEST_EQUAL(lines[1], "Host: a");

	TEST_EQUAL(split_trace_lines("\r\n").size(), 0);
	TEST_EQUAL(split_trace_lines("Connected to proxy\n").size(), 1);
}

CURLMUX_TEST(sanitize_authorization)
{
	// the scheme stays, the credentials are replaced by their length
	TEST_EQUAL(sanitize_trace_line("Proxy-Authorization: Basic dXNlcjpwYXNz")
		, "Proxy-Authorization: Basic sanitized len(13)");
	TEST_EQUAL(sanitize_trace_line("authorization: Bearer abc")
		, "authorization: Bearer sanitized len(4)");
	TEST_EQUAL(sanitize_trace_line("Proxy-Authenticate: NTLM TlRMTVNTUAACAAAA")
		, "Proxy-Authenticate: NTLM sanitized len(17)");

	// nothing after the scheme, nothing to hide
	TEST_EQUAL(sanitize_trace_line("Proxy-Authenticate: Negotiate")
		, "Proxy-Authenticate: Negotiate");
}

CURLMUX_TEST(sanitize_proxy_auth_notice)
{
	TEST_EQUAL(sanitize_trace_line("Proxy auth using Basic with user 'joe'")
		, "Proxy auth using Basic sanitized len(16)");
}

CURLMUX_TEST(sanitize_other_lines)
{
	TEST_EQUAL(sanitize_trace_line("Host: example.com"), "Host: example.com");
	TEST_EQUAL(sanitize_trace_line("CONNECT example.com:443 HTTP/1.1")
		, "CONNECT example.com:443 HTTP/1.1");
}
