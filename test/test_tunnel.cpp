/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"
#include "http_server.hpp"
#include "curlmux/multiplexer.hpp"
#include "curlmux/proxy_auth_cache.hpp"
#include "curlmux/transfer.hpp"
#include "curlmux/tunnel.hpp"
#include "curlmux/aux_/socket_io.hpp"

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace curlmux;
using namespace std::chrono;

namespace {

transfer_env local_env(proxy_auth_cache& cache)
{
	transfer_env env;
	env.auth_cache = &cache;
	return env;
}

bool has_request(std::string const& line)
{
	auto const requests = http_server_requests();
	return std::find(requests.begin(), requests.end(), line) != requests.end();
}

std::string const established = "HTTP/1.1 200 Connection established\r\n\r\n";

}

CURLMUX_TEST(bootstrap_plain_proxy)
{
	proxy_auth_cache cache;
	transfer t("curlmux.test:443", "CONNECT", "HTTP/1.1", 60, local_env(cache));
	TEST_CHECK(t.set_proxy("127.0.0.1", 3128, std::string()));
	t.set_headers({{"Host", "curlmux.test:443"}, {"Proxy-Authorization", "Basic Zm9vOmJhcg=="}});

	TEST_EQUAL(tunnel_bootstrap(t, true)
		, "CONNECT curlmux.test:443 HTTP/1.1\r\n"
		"Host: curlmux.test:443\r\n"
		"Proxy-Authorization: Basic Zm9vOmJhcg==\r\n"
		"\r\n");

	// the proxy wasn't used, the connection goes to the target
	TEST_EQUAL(tunnel_bootstrap(t, false), "");
}

CURLMUX_TEST(bootstrap_without_headers)
{
	proxy_auth_cache cache;
	transfer t("curlmux.test:443", "CONNECT", "HTTP/1.0", 60, local_env(cache));
	TEST_CHECK(t.set_proxy("127.0.0.1", 3128, std::string()));
	TEST_EQUAL(tunnel_bootstrap(t, true), "CONNECT curlmux.test:443 HTTP/1.0\r\n\r\n");
}

CURLMUX_TEST(bootstrap_empty)
{
	proxy_auth_cache cache;

	// libcurl made the CONNECT itself
	transfer tunneled("curlmux.test:443", "CONNECT", "HTTP/1.1", 60, local_env(cache));
	TEST_CHECK(tunneled.set_proxy("127.0.0.1", 3128, std::string()));
	tunneled.set_auth("user", std::string("pass"));
	TEST_CHECK(tunneled.is_tunnel());
	TEST_EQUAL(tunnel_bootstrap(tunneled, true), "");

	transfer get("http://curlmux.test/", "GET", "HTTP/1.1", 60, local_env(cache));
	TEST_CHECK(get.set_proxy("127.0.0.1", 3128, std::string()));
	TEST_EQUAL(tunnel_bootstrap(get, true), "");
}

CURLMUX_TEST(relay_both_directions)
{
	socket_pair client;
	socket_pair tunnel;

	relay_stats stats;
	std::thread relay([&]
	{
		stats = relay_sockets(client.first(), tunnel.first(), "", relay_options());
	});

	write_all(client.second(), "ping");
	TEST_EQUAL(read_exactly(tunnel.second(), 4), "ping");
	write_all(tunnel.second(), "pong!");
	TEST_EQUAL(read_exactly(client.second(), 5), "pong!");

	client.close_second();
	relay.join();

	TEST_EQUAL(stats.client_to_tunnel, 4);
	TEST_EQUAL(stats.tunnel_to_client, 5);
	TEST_EQUAL(stats.bytes_read, 9);
	TEST_EQUAL(stats.bytes_written, 9);
}

CURLMUX_TEST(relay_sends_bootstrap_first)
{
	socket_pair client;
	socket_pair tunnel;

	std::thread relay([&]
	{
		relay_sockets(client.first(), tunnel.first(), "CONNECT a:1 HTTP/1.1\r\n\r\n"
			, relay_options());
	});

	write_all(client.second(), "data");
	TEST_EQUAL(read_exactly(tunnel.second(), 29), "CONNECT a:1 HTTP/1.1\r\n\r\ndata");

	tunnel.close_second();
	relay.join();
}

CURLMUX_TEST(relay_large_payload)
{
	socket_pair client;
	socket_pair tunnel;

	std::string payload(1024 * 1024, '\0');
	for (std::size_t i = 0; i < payload.size(); ++i)
		payload[i] = char(i * 7 + i / 4096);

	relay_options opts;
	opts.chunk_size = 1000;
	relay_stats stats;
	std::thread relay([&]
	{
		stats = relay_sockets(client.first(), tunnel.first(), "", opts);
	});
	std::thread writer([&] { write_all(client.second(), payload); });

	std::string const received = read_exactly(tunnel.second(), payload.size());
	writer.join();
	TEST_EQUAL(received.size(), payload.size());
	TEST_CHECK(received == payload);

	client.close_second();
	relay.join();
	TEST_EQUAL(stats.client_to_tunnel, std::int64_t(payload.size()));
	TEST_EQUAL(stats.bytes_written, std::int64_t(payload.size()));
}

CURLMUX_TEST(relay_flushes_after_close)
{
	socket_pair client;
	socket_pair tunnel;

	// the tunnel side sends its last bytes and closes right away
	write_all(tunnel.second(), "goodbye");
	tunnel.close_second();

	relay_stats stats = relay_sockets(client.first(), tunnel.first(), "", relay_options());
	TEST_EQUAL(stats.tunnel_to_client, 7);
	TEST_EQUAL(read_exactly(client.second(), 7), "goodbye");
}

CURLMUX_TEST(relay_idle_timeout)
{
	socket_pair client;
	socket_pair tunnel;

	relay_options opts;
	opts.idle_timeout = milliseconds(200);

	auto const start = steady_clock::now();
	relay_stats const stats = relay_sockets(client.first(), tunnel.first(), "", opts);
	auto const elapsed = steady_clock::now() - start;

	TEST_CHECK(elapsed >= milliseconds(150));
	TEST_CHECK(elapsed < seconds(5));
	TEST_EQUAL(stats.bytes_read, 0);
	TEST_EQUAL(stats.bytes_written, 0);
}

CURLMUX_TEST(relay_stops_on_out_of_band_data)
{
	tcp_pair client;
	socket_pair tunnel;

	// the server has bytes waiting, but the client's urgent data ends the
	// relay before anything is moved
	write_all(tunnel.second(), "pending");
	client.send_out_of_band('!');

	{
		boost::asio::io_context ios;
		error_code ec;
		aux::readiness const r = aux::wait_readiness(ios, {}, {}, std::vector<int>{client.first()}
			, seconds(5), ec);
		TEST_EQUAL(r.error.size(), 1);
	}

	relay_options opts;
	opts.idle_timeout = seconds(10);

	auto const start = steady_clock::now();
	relay_stats const stats = relay_sockets(client.first(), tunnel.first(), "", opts);
	TEST_CHECK(steady_clock::now() - start < seconds(5));

	TEST_EQUAL(stats.bytes_read, 0);
	TEST_EQUAL(stats.bytes_written, 0);
	TEST_EQUAL(read_exactly(client.second(), 7, milliseconds(200)), "");
	TEST_EQUAL(read_exactly(tunnel.first(), 7), "pending");
}

CURLMUX_TEST(relay_without_socket)
{
	proxy_auth_cache cache;
	transfer t("curlmux.test:443", "CONNECT", "HTTP/1.1", 60, local_env(cache));
	socket_pair client;
	relay_stats const stats = relay_tunnel(t, client.first());
	TEST_EQUAL(stats.bytes_read, 0);
	TEST_EQUAL(stats.bytes_written, 0);
}

CURLMUX_TEST(connect_direct)
{
	int const port = start_http_server(server_mode::echo);
	proxy_auth_cache cache;
	multiplexer mux(settings_pack(), cache);

	transfer t("127.0.0.1:" + std::to_string(port), "CONNECT", "HTTP/1.1", 10, mux.env());
	TEST_CHECK(mux.do_transfer(t));
	TEST_EQUAL(t.response(), 200);
	TEST_CHECK(t.socket().has_value());
	TEST_CHECK(t.used_proxy() == false);

	socket_pair client;
	relay_stats stats;
	std::thread relay([&] { stats = mux.relay(t, client.first()); });

	write_all(client.second(), "ping");
	TEST_EQUAL(read_exactly(client.second(), 4), "ping");

	client.close_second();
	relay.join();
	TEST_EQUAL(stats.client_to_tunnel, 4);
	TEST_EQUAL(stats.tunnel_to_client, 4);

	mux.remove(t);
	stop_http_server();
}

CURLMUX_TEST(connect_plain_proxy)
{
	int const port = start_http_server(server_mode::proxy);
	proxy_auth_cache cache;
	multiplexer mux(settings_pack(), cache);

	// the client's CONNECT is replayed to the proxy as-is
	transfer t("curlmux.test:443", "CONNECT", "HTTP/1.1", 10, mux.env());
	TEST_CHECK(t.set_proxy("127.0.0.1", port, std::string()));
	t.set_headers({{"Host", "curlmux.test:443"}});
	TEST_CHECK(!t.is_tunnel());

	TEST_CHECK(mux.do_transfer(t));
	TEST_EQUAL(t.response(), 200);
	TEST_CHECK(t.socket().has_value());
	TEST_CHECK(t.used_proxy() == true);

	socket_pair client;
	relay_stats stats;
	std::thread relay([&] { stats = mux.relay(t, client.first()); });

	TEST_EQUAL(read_exactly(client.second(), established.size()), established);
	write_all(client.second(), "ping");
	TEST_EQUAL(read_exactly(client.second(), 4), "ping");

	client.close_second();
	relay.join();
	TEST_CHECK(has_request("CONNECT curlmux.test:443 HTTP/1.1"));
	TEST_EQUAL(stats.tunnel_to_client, std::int64_t(established.size() + 4));

	mux.remove(t);
	stop_http_server();
}

CURLMUX_TEST(connect_authenticated_tunnel)
{
	// "user:pass"
	int const port = start_http_server(server_mode::proxy, "Basic dXNlcjpwYXNz");
	proxy_auth_cache cache;
	multiplexer mux(settings_pack(), cache);

	transfer t("curlmux.test:443", "CONNECT", "HTTP/1.1", 10, mux.env());
	TEST_CHECK(t.set_proxy("127.0.0.1", port, std::string()));
	t.set_auth("user", std::string("pass"));
	TEST_CHECK(t.is_tunnel());

	TEST_CHECK(mux.do_transfer(t));
	TEST_EQUAL(t.response(), 200);
	TEST_CHECK(t.socket().has_value());
	TEST_EQUAL(cache.mechanism("127.0.0.1").value_or(""), "BASIC");

	// libcurl consumed the proxy's reply, only the payload is relayed
	socket_pair client;
	relay_stats stats;
	std::thread relay([&] { stats = mux.relay(t, client.first()); });

	write_all(client.second(), "ping");
	TEST_EQUAL(read_exactly(client.second(), 4), "ping");

	client.close_second();
	relay.join();
	TEST_EQUAL(stats.tunnel_to_client, 4);

	mux.remove(t);
	stop_http_server();
}
