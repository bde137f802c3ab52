/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <thread>

#include "curlmux/multiplexer.hpp"
#include "curlmux/logger.hpp"
#include "curlmux/transfer.hpp"

// runs a GET and a POST at the same time on one multiplexer, each driven by
// its own thread
int main(int argc, char const* argv[]) try
{
	if (argc < 3)
	{
		std::cerr << "usage: curlmux_multi get-url post-url [post-data]\n";
		return 1;
	}

	std::string const data = argc > 3 ? argv[3] : "curlmux";

	curlmux::stderr_logger log;
	curlmux::multiplexer mux(curlmux::settings_pack(), curlmux::proxy_auth_cache::global(), &log);

	curlmux::transfer get(argv[1], "GET", "HTTP/1.1", mux.env());
	get.buffer();

	curlmux::transfer post(argv[2], "POST", "HTTP/1.1", mux.env());
	post.buffer(data);
	post.set_headers({{"Content-Length", std::to_string(data.size())}
		, {"Content-Type", "text/plain"}});

	bool get_ok = false;
	bool post_ok = false;
	std::thread get_thread([&] { get_ok = mux.do_transfer(get); });
	std::thread post_thread([&] { post_ok = mux.do_transfer(post); });
	get_thread.join();
	post_thread.join();

	for (curlmux::transfer const* t : {&get, &post})
	{
		std::printf("%s %s: %ld %s\n%s\n", t->method().c_str(), t->url().c_str()
			, t->response(), t->error_text().c_str(), t->get_data().c_str());
	}

	mux.remove(get);
	mux.remove(post);
	return get_ok && post_ok ? 0 : 1;
}
catch (std::exception const& e)
{
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}
