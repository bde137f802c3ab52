/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_ASSERT_HPP_INCLUDED
#define CURLMUX_ASSERT_HPP_INCLUDED

#include "curlmux/config.hpp"

namespace curlmux {

// internal
CURLMUX_EXPORT void assert_print(char const* fmt, ...) CURLMUX_FORMAT(1,2);

// internal
CURLMUX_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function, char const* val, int kind = 0);

}

#if CURLMUX_USE_ASSERTS

#define CURLMUX_ASSERT_PRECOND(x) \
	do { if (x) {} else curlmux::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 1); } while (false)

#define CURLMUX_ASSERT(x) \
	do { if (x) {} else curlmux::assert_fail(#x, __LINE__, __FILE__, __func__, nullptr, 0); } while (false)

#define CURLMUX_ASSERT_FAIL() \
	curlmux::assert_fail("<unconditional>", __LINE__, __FILE__, __func__, nullptr, 0)

#else // CURLMUX_USE_ASSERTS

#define CURLMUX_ASSERT_PRECOND(a) do {} while (false)
#define CURLMUX_ASSERT(a) do {} while (false)
#define CURLMUX_ASSERT_FAIL() do {} while (false)

#endif // CURLMUX_USE_ASSERTS

#endif // CURLMUX_ASSERT_HPP_INCLUDED
