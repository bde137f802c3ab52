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
#include <vector>

#include "curlmux/engine_info.hpp"
#include "curlmux/multiplexer.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/transfer.hpp"

namespace {

void print_usage()
{
	std::cerr << R"(usage: curlmux_query [options] url...
    runs every request method against each url and prints the outcome
    OPTIONS:
    --proxy <host:port>      send the requests through an HTTP proxy
    --user <user[:password]> authenticate with the proxy
    --standalone             run each transfer on its own easy handle
    --insecure               don't verify server certificates
    --log                    print the library's log to stderr
)";
	std::exit(1);
}

char const* const methods[] = {"GET", "HEAD", "POST", "PUT", "PATCH", "DELETE"};

}

int main(int argc, char const* argv[]) try
{
	std::string proxy;
	int proxy_port = 0;
	std::string user;
	std::optional<std::string> password;
	bool standalone = false;
	bool insecure = false;
	bool enable_log = false;
	std::vector<std::string> urls;

	for (int i = 1; i < argc; ++i)
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
		else if (arg == "--standalone") standalone = true;
		else if (arg == "--insecure") insecure = true;
		else if (arg == "--log") enable_log = true;
		else if (arg.substr(0, 2) == "--")
		{
			std::cerr << "unknown option: " << arg << "\n";
			print_usage();
		}
		else urls.emplace_back(arg);
	}

	std::printf("libcurl %s\n", curlmux::engine_version().c_str());
	std::string const ssl = curlmux::engine_ssl_version();
	std::printf("TLS: %s\nfeatures:", ssl.empty() ? "none" : ssl.c_str());
	for (auto const& f : curlmux::engine_features())
		std::printf(" %s", f.c_str());
	std::printf("\n");

	if (urls.empty()) return 0;

	curlmux::stderr_logger log(stderr, enable_log);
	curlmux::settings_pack sp;
	sp.set_bool(curlmux::settings_pack::multiplexed_transfers, !standalone);
	curlmux::multiplexer mux(sp, curlmux::proxy_auth_cache::global(), &log);

	std::string const body = "curlmux query";
	int failures = 0;
	for (auto const& url : urls)
	{
		for (char const* method : methods)
		{
			curlmux::transfer t(url, method, "HTTP/1.1", 30, mux.env());
			if (insecure) t.set_insecure();
			if (!proxy.empty())
			{
				if (!t.set_proxy(proxy, proxy_port))
				{
					std::printf("%-6s %s: proxy refused\n", method, url.c_str());
					++failures;
					continue;
				}
				if (!user.empty()) t.set_auth(user, password);
			}

			std::string const m = method;
			if (m == "POST" || m == "PUT" || m == "PATCH")
			{
				t.buffer(body);
				t.set_headers({{"Content-Length", std::to_string(body.size())}});
			}
			else
			{
				t.buffer();
			}

			bool const ok = mux.do_transfer(t);
			std::printf("%-6s %s: %ld, %d bytes%s%s\n", method, url.c_str()
				, t.response(), int(t.get_data().size())
				, ok ? "" : ", ", t.error_text().c_str());
			if (!ok) ++failures;
			mux.remove(t);
		}
	}
	return failures == 0 ? 0 : 1;
}
catch (std::exception const& e)
{
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}
