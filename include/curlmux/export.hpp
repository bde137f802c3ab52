/*

Copyright (c) 2005, 2008-2009, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_EXPORT_HPP_INCLUDED
#define CURLMUX_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// CURLMUX_BUILDING_SHARED is defined while building the shared library,
// CURLMUX_LINKING_SHARED by clients linking against it.
#if defined CURLMUX_BUILDING_SHARED
# define CURLMUX_EXPORT BOOST_SYMBOL_EXPORT
#elif defined CURLMUX_LINKING_SHARED
# define CURLMUX_EXPORT BOOST_SYMBOL_IMPORT
#endif

// symbols in the aux namespace that the unit tests need to reach
#if defined CURLMUX_EXPORT_EXTRA
# if defined CURLMUX_BUILDING_SHARED
#  define CURLMUX_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined CURLMUX_LINKING_SHARED
#  define CURLMUX_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef CURLMUX_EXPORT
# define CURLMUX_EXPORT
#endif

#ifndef CURLMUX_EXTRA_EXPORT
# define CURLMUX_EXTRA_EXPORT
#endif

#endif // CURLMUX_EXPORT_HPP_INCLUDED
