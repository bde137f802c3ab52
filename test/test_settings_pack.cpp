/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "curlmux/settings_pack.hpp"

#include <cstring>

using namespace curlmux;

CURLMUX_TEST(default_settings)
{
	settings_pack const sp;

	TEST_EQUAL(sp.get_str(settings_pack::ca_bundle), "");
	TEST_EQUAL(sp.get_str(settings_pack::user_agent), "");
	TEST_EQUAL(sp.get_int(settings_pack::connect_timeout), 60);
	TEST_EQUAL(sp.get_int(settings_pack::poll_interval), 10);
	TEST_EQUAL(sp.get_int(settings_pack::tunnel_idle_timeout), 30);
	TEST_EQUAL(sp.get_int(settings_pack::tunnel_chunk_size), 4096);
	TEST_EQUAL(sp.get_int(settings_pack::max_total_connections), 0);
	TEST_EQUAL(sp.get_int(settings_pack::max_host_connections), 0);
	TEST_EQUAL(sp.get_bool(settings_pack::verbose_trace), true);
	TEST_EQUAL(sp.get_bool(settings_pack::sanitize_log), true);
	TEST_EQUAL(sp.get_bool(settings_pack::multiplexed_transfers), true);
}

CURLMUX_TEST(sparse_pack)
{
	settings_pack pack;
	TEST_EQUAL(pack.has_val(settings_pack::sanitize_log), false);

	pack.set_bool(settings_pack::sanitize_log, false);

	TEST_EQUAL(pack.has_val(settings_pack::sanitize_log), true);
	TEST_EQUAL(pack.has_val(settings_pack::user_agent), false);
	TEST_EQUAL(pack.get_bool(settings_pack::sanitize_log), false);
}

CURLMUX_TEST(set_replaces)
{
	settings_pack pack;
	pack.set_int(settings_pack::poll_interval, 5);
	pack.set_int(settings_pack::poll_interval, 7);
	TEST_EQUAL(pack.get_int(settings_pack::poll_interval), 7);

	pack.set_str(settings_pack::user_agent, "curlmux/1.0");
	pack.set_str(settings_pack::ca_bundle, "/etc/ssl/certs/ca-certificates.crt");
	TEST_EQUAL(pack.get_str(settings_pack::user_agent), "curlmux/1.0");
	TEST_EQUAL(pack.get_str(settings_pack::ca_bundle), "/etc/ssl/certs/ca-certificates.crt");
}

CURLMUX_TEST(clear)
{
	settings_pack pack;
	pack.set_int(settings_pack::tunnel_chunk_size, 1024);
	pack.set_bool(settings_pack::verbose_trace, false);

	pack.clear(settings_pack::tunnel_chunk_size);
	TEST_EQUAL(pack.has_val(settings_pack::tunnel_chunk_size), false);
	TEST_EQUAL(pack.get_int(settings_pack::tunnel_chunk_size), 4096);
	TEST_EQUAL(pack.has_val(settings_pack::verbose_trace), true);

	pack.clear();
	TEST_EQUAL(pack.has_val(settings_pack::verbose_trace), false);
	TEST_EQUAL(pack.get_bool(settings_pack::verbose_trace), true);
}

CURLMUX_TEST(test_name)
{
#define TEST_NAME(n) \
	TEST_EQUAL(setting_by_name(#n), settings_pack:: n); \
	TEST_CHECK(std::strcmp(name_for_setting(settings_pack:: n), #n) == 0)

	TEST_NAME(ca_bundle);
	TEST_NAME(user_agent);
	TEST_NAME(connect_timeout);
	TEST_NAME(poll_interval);
	TEST_NAME(tunnel_idle_timeout);
	TEST_NAME(tunnel_chunk_size);
	TEST_NAME(max_total_connections);
	TEST_NAME(max_host_connections);
	TEST_NAME(verbose_trace);
	TEST_NAME(sanitize_log);
	TEST_NAME(multiplexed_transfers);
#undef TEST_NAME

	TEST_EQUAL(setting_by_name("no_such_setting"), -1);
	TEST_EQUAL(std::string(name_for_setting(settings_pack::int_type_base + 1000)), "");
}
