/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "test_utils.hpp"
#include "curlmux/aux_/socket_io.hpp"
#include "curlmux/body_stream.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace curlmux;
using namespace std::chrono;

CURLMUX_TEST(wait_timeout)
{
	socket_pair p;
	boost::asio::io_context ios;
	error_code ec;
	auto const start = steady_clock::now();
	aux::readiness const r = aux::wait_readiness(ios, std::vector<int>{p.first()}, {}, {}, milliseconds(50), ec);
	TEST_CHECK(!ec);
	TEST_CHECK(r.empty());
	TEST_CHECK(steady_clock::now() - start >= milliseconds(40));
}

CURLMUX_TEST(wait_nothing)
{
	boost::asio::io_context ios;
	error_code ec;
	aux::readiness const r = aux::wait_readiness(ios, std::vector<int>(), {}, {}
		, milliseconds(5000), ec);
	TEST_CHECK(!ec);
	TEST_CHECK(r.empty());
}

CURLMUX_TEST(wait_readable_and_writable)
{
	socket_pair p;
	write_all(p.second(), "x");

	boost::asio::io_context ios;
	error_code ec;
	aux::readiness const r = aux::wait_readiness(ios, std::vector<int>{p.first()}, {p.second()}, {}
		, milliseconds(1000), ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.read.size(), 1);
	TEST_EQUAL(r.write.size(), 1);
	TEST_CHECK(r.error.empty());
	if (r.read.size() == 1) TEST_EQUAL(r.read[0], p.first());
	if (r.write.size() == 1) TEST_EQUAL(r.write[0], p.second());

	TEST_EQUAL(read_exactly(p.first(), 1), "x");
}

CURLMUX_TEST(wait_same_descriptor_in_every_list)
{
	socket_pair p;
	write_all(p.second(), "x");

	boost::asio::io_context ios;
	error_code ec;
	aux::readiness const r = aux::wait_readiness(ios, {p.first(), p.first()}
		, {p.first()}, {p.first()}, milliseconds(1000), ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.read.size(), 1);
	TEST_EQUAL(r.write.size(), 1);
	TEST_CHECK(r.error.empty());
}

CURLMUX_TEST(wait_is_repeatable)
{
	socket_pair p;
	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.first());
	error_code ec;

	// nothing is left pending on the context between waits
	for (int i = 0; i < 3; ++i)
	{
		aux::readiness const r = aux::wait_readiness(ios, {&d.get()}, {}, {&d.get()}
			, milliseconds(10), ec);
		TEST_CHECK(!ec);
		TEST_CHECK(r.empty());
	}

	write_all(p.second(), "y");
	aux::readiness const r = aux::wait_readiness(ios, {&d.get()}, {}, {&d.get()}
		, milliseconds(1000), ec);
	TEST_EQUAL(r.read.size(), 1);
	TEST_CHECK(r.error.empty());
}

CURLMUX_TEST(closed_peer_is_readable)
{
	socket_pair p;
	p.close_second();

	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.first());
	error_code ec;

	// a hang-up is not an exceptional condition
	aux::readiness const r = aux::wait_readiness(ios, {&d.get()}, {}, {&d.get()}
		, milliseconds(1000), ec);
	TEST_EQUAL(r.read.size(), 1);
	TEST_CHECK(r.error.empty());

	char buf[10];
	TEST_EQUAL(aux::read_some(d.get(), buf, sizeof(buf), ec), 0);
	TEST_CHECK(!ec);
}

CURLMUX_TEST(hang_up_without_read_interest)
{
	socket_pair p;
	p.close_second();

	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.first());
	error_code ec;

	// nobody waits for this descriptor to become readable, so the hang-up
	// is the exceptional condition
	aux::readiness const r = aux::wait_readiness(ios, {}, {}, {&d.get()}
		, milliseconds(1000), ec);
	TEST_CHECK(!ec);
	TEST_CHECK(r.read.empty());
	TEST_EQUAL(r.error.size(), 1);
	TEST_EQUAL(r.error.front(), p.first());
}

CURLMUX_TEST(out_of_band_data_is_exceptional)
{
	tcp_pair p;
	p.send_out_of_band('!');

	boost::asio::io_context ios;
	error_code ec;
	aux::readiness const r = aux::wait_readiness(ios, std::vector<int>{p.first()}, {}, {p.first()}
		, milliseconds(5000), ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.error.size(), 1);
	TEST_CHECK(r.read.empty());
}

CURLMUX_TEST(released_not_closed)
{
	socket_pair p;
	{
		boost::asio::io_context ios;
		aux::borrowed_descriptor d(ios, p.first());
	}

	// still open and connected
	write_all(p.first(), "abc");
	TEST_EQUAL(read_exactly(p.second(), 3), "abc");
}

CURLMUX_TEST(borrow_bad_descriptor)
{
	boost::asio::io_context ios;
	error_code ec;
	aux::borrowed_descriptor d(ios, -1, ec);
	TEST_CHECK(ec);
	TEST_THROW(aux::borrowed_descriptor(ios, -1));
}

CURLMUX_TEST(write_some_full_buffer)
{
	socket_pair p;
	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.second());
	error_code ec;
	d.get().non_blocking(true, ec);
	TEST_CHECK(!ec);

	// fill the socket buffer, a full buffer is not an error
	std::string const chunk(65536, 'a');
	std::size_t total = 0;
	for (int i = 0; i < 1000; ++i)
	{
		std::size_t const n = aux::write_some(d.get(), chunk.data(), chunk.size(), ec);
		TEST_CHECK(!ec);
		if (n == 0) break;
		total += n;
	}
	TEST_CHECK(total > 0);
	TEST_EQUAL(aux::write_some(d.get(), chunk.data(), chunk.size(), ec), 0);
	TEST_CHECK(!ec);
}

CURLMUX_TEST(nothing_to_read_would_block)
{
	socket_pair p;
	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.first());
	error_code ec;
	d.get().non_blocking(true, ec);
	TEST_CHECK(!ec);

	char buf[10];
	TEST_EQUAL(aux::read_some(d.get(), buf, sizeof(buf), ec), 0);
	TEST_CHECK(ec == boost::asio::error::would_block);
}

CURLMUX_TEST(write_to_closed_socket)
{
	socket_pair p;
	p.close_first();

	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.second());
	error_code ec;
	aux::write_some(d.get(), "abc", 3, ec);
	TEST_CHECK(ec);
}

CURLMUX_TEST(write_all_waits)
{
	socket_pair p;
	std::string const payload(1024 * 1024, 'z');
	std::string received;

	std::thread reader([&]
	{
		received = read_exactly(p.first(), payload.size());
	});

	boost::asio::io_context ios;
	aux::borrowed_descriptor d(ios, p.second());
	error_code ec;
	aux::write_all(d.get(), payload.data(), payload.size(), ec);
	reader.join();
	TEST_CHECK(!ec);
	TEST_EQUAL(received.size(), payload.size());
	TEST_CHECK(received == payload);
}

CURLMUX_TEST(memory_streams)
{
	memory_source src("0123456789");
	char buf[4];
	error_code ec;
	TEST_EQUAL(src.read(buf, sizeof(buf), ec), 4);
	TEST_EQUAL(std::string(buf, 4), "0123");
	TEST_EQUAL(src.remaining(), 6);
	TEST_EQUAL(src.read(buf, sizeof(buf), ec), 4);
	TEST_EQUAL(src.read(buf, sizeof(buf), ec), 2);
	TEST_EQUAL(std::string(buf, 2), "89");
	TEST_EQUAL(src.read(buf, sizeof(buf), ec), 0);
	TEST_CHECK(!ec);

	memory_sink sink;
	TEST_EQUAL(sink.write("abc", 3, ec), 3);
	TEST_EQUAL(sink.write("de", 2, ec), 2);
	TEST_EQUAL(sink.data(), "abcde");
	sink.clear();
	TEST_EQUAL(sink.data(), "");
}

CURLMUX_TEST(socket_streams)
{
	socket_pair p;
	socket_sink sink(p.fds[0]);
	socket_source src(p.fds[1]);

	error_code ec;
	TEST_EQUAL(sink.write("request body", 12, ec), 12);
	TEST_CHECK(!ec);

	std::string got;
	char buf[64];
	while (got.size() < 12)
	{
		std::size_t const n = src.read(buf, sizeof(buf), ec);
		if (ec || n == 0) break;
		got.append(buf, n);
	}
	TEST_EQUAL(got, "request body");

	p.close_first();
	TEST_EQUAL(src.read(buf, sizeof(buf), ec), 0);
	TEST_CHECK(!ec);
}
