/*

Copyright (c) 2005, 2007-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_CONFIG_HPP_INCLUDED
#define CURLMUX_CONFIG_HPP_INCLUDED

#include <boost/config.hpp>
#include <boost/version.hpp>

#include "curlmux/export.hpp"

#if defined _WIN32 || defined __CYGWIN__
#define CURLMUX_WINDOWS
#endif

#if defined __GNUC__ || defined __clang__
#define CURLMUX_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define CURLMUX_FORMAT(fmt, ellipsis)
#endif

#ifndef CURLMUX_USE_ASSERTS
#define CURLMUX_USE_ASSERTS 0
#endif

// when set, exceptions escaping the libcurl callback shims are printed to
// stderr
#ifndef CURLMUX_DEBUG_LIBCURL
#define CURLMUX_DEBUG_LIBCURL 0
#endif

// where the shipped CA bundle is installed. Overridden by the build system
#ifndef CURLMUX_CA_BUNDLE
#define CURLMUX_CA_BUNDLE "/usr/local/share/curlmux/cacert.pem"
#endif

#define CURLMUX_VERSION_MAJOR 1
#define CURLMUX_VERSION_MINOR 0
#define CURLMUX_VERSION_TINY 0

#define CURLMUX_VERSION "1.0.0"

#endif // CURLMUX_CONFIG_HPP_INCLUDED
