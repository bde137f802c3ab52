/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "curlmux/aux_/send_queue.hpp"

#include <string>

using namespace curlmux::aux;

CURLMUX_TEST(empty_queue)
{
	send_queue q;
	TEST_CHECK(q.empty());
	TEST_EQUAL(q.size(), 0);
	TEST_CHECK(q.front().empty());

	q.append("", 0);
	TEST_CHECK(q.empty());
	TEST_EQUAL(q.num_buffers(), 0);
}

CURLMUX_TEST(fifo_order)
{
	send_queue q;
	q.append("abc", 3);
	q.append("defg", 4);
	TEST_EQUAL(q.size(), 7);
	TEST_EQUAL(q.num_buffers(), 2);

	TEST_EQUAL(q.front(), "abc");
	q.pop_front(3);
	TEST_EQUAL(q.front(), "defg");
	q.pop_front(4);
	TEST_CHECK(q.empty());
}

CURLMUX_TEST(short_write)
{
	send_queue q;
	q.append("hello", 5);
	q.append("world", 5);

	// the unsent tail stays ahead of later data
	q.pop_front(2);
	TEST_EQUAL(q.front(), "llo");
	TEST_EQUAL(q.size(), 8);
	q.append("!", 1);

	std::string out;
	while (!q.empty())
	{
		auto const f = q.front();
		out.append(f.data(), 1);
		q.pop_front(1);
	}
	TEST_EQUAL(out, "lloworld!");
}

CURLMUX_TEST(zero_write)
{
	send_queue q;
	q.append("abc", 3);
	q.pop_front(0);
	TEST_EQUAL(q.front(), "abc");
	TEST_EQUAL(q.size(), 3);
}

CURLMUX_TEST(clear)
{
	send_queue q;
	q.append("abc", 3);
	q.pop_front(1);
	q.clear();
	TEST_CHECK(q.empty());
	TEST_CHECK(q.front().empty());
	q.append("x", 1);
	TEST_EQUAL(q.front(), "x");
}
