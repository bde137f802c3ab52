/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "curlmux/multiplexer.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/settings_pack.hpp"
#include "curlmux/transfer.hpp"

namespace {

void print_usage()
{
	std::cerr << R"(usage: curlmux_get url [options]
    OPTIONS:
    --proxy <host:port>      send the request through an HTTP proxy
    --user <user[:password]> authenticate with the proxy
    --auth <mechanism>       proxy auth mechanism, defaults to ANY
    --insecure               don't verify the server's certificate
    --debug                  log libcurl's trace to stderr
)";
	std::exit(1);
}

}

int main(int argc, char const* argv[]) try
{
	if (argc < 2) print_usage();

	std::string const url = argv[1];
	std::string proxy;
	int proxy_port = 0;
	std::string user;
	std::optional<std::string> password;
	std::string auth = "ANY";
	bool insecure = false;
	bool debug = false;

	for (int i = 2; i < argc; ++i)
	{
		std::string_view const arg = argv[i];
		if (arg == "--proxy" && i + 1 < argc)
		{
			proxy = argv[++i];
			auto const colon = proxy.rfind(':');
			if (colon != std::string::npos)
			{
				proxy_port = std::atoi(proxy.c_str() + colon + 1);
				proxy.resize(colon);
			}
		}
		else if (arg == "--user" && i + 1 < argc)
		{
			user = argv[++i];
			auto const colon = user.find(':');
			if (colon != std::string::npos)
			{
				password = user.substr(colon + 1);
				user.resize(colon);
			}
		}
		else if (arg == "--auth" && i + 1 < argc)
		{
			auth = argv[++i];
		}
		else if (arg == "--insecure")
		{
			insecure = true;
		}
		else if (arg == "--debug")
		{
			debug = true;
		}
		else
		{
			std::cerr << "unknown option: " << arg << "\n";
			print_usage();
		}
	}

	curlmux::stderr_logger log(stderr, debug);
	curlmux::settings_pack sp;
	sp.set_bool(curlmux::settings_pack::multiplexed_transfers, false);
	curlmux::multiplexer mux(sp, curlmux::proxy_auth_cache::global(), &log);

	curlmux::transfer t(url, "GET", "HTTP/1.1", mux.env());
	t.set_debug(debug);
	t.set_follow();
	if (insecure) t.set_insecure();
	if (!proxy.empty())
	{
		if (!t.set_proxy(proxy, proxy_port))
		{
			std::fprintf(stderr, "proxy %s refused our credentials before\n", proxy.c_str());
			return 1;
		}
		if (!user.empty()) t.set_auth(user, password, auth);
	}
	t.buffer();

	bool const ok = mux.do_transfer(t);
	std::printf("status: %ld\n", t.response());
	if (!ok) std::printf("error: %s\n", t.error_text().c_str());
	std::printf("%s\n%s", t.get_headers().c_str(), t.get_data().c_str());
	return ok ? 0 : 1;
}
catch (std::exception const& e)
{
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}
