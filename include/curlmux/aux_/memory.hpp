/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_MEMORY_HPP
#define CURLMUX_MEMORY_HPP

#include <memory>

namespace curlmux::aux {

template<auto F>
struct unique_ptr_destructor {
	template<typename T>
	constexpr void operator()(T* arg) const { (void) F(arg); }
};

template<typename T, auto F>
using unique_ptr_with_deleter = std::unique_ptr<T, unique_ptr_destructor<F> >;
}

#endif //CURLMUX_MEMORY_HPP
