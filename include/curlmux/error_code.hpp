/*

Copyright (c) 2008-2009, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_ERROR_CODE_HPP_INCLUDED
#define CURLMUX_ERROR_CODE_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace curlmux {

	using error_code = boost::system::error_code;
	using system_error = boost::system::system_error;
	using boost::system::generic_category;
	using boost::system::system_category;

namespace errors {

	// libcurl reports its own failures as CURLcode on the transfer. These
	// are the conditions curlmux itself detects.
	enum error_code_enum
	{
		// Not an error
		no_error = 0,
		// the proxy authentication mechanism name is not recognized
		invalid_auth_mechanism,
		// the multi option is reserved for the scheduler's own callbacks
		reserved_option,
		// the transfer is registered with another scheduler
		already_registered,

		// the number of error codes
		error_code_max
	};

	// HTTP shaped outcomes a transfer ends up with
	enum http_errors
	{
		cont = 100,
		ok = 200,
		bad_request = 400,
		unauthorized = 401,
		forbidden = 403,
		not_found = 404,
		proxy_authentication_required = 407,
		internal_server_error = 500,
		not_implemented = 501,
		bad_gateway = 502,
		service_unavailable = 503,
		gateway_timeout = 504
	};

	// hidden
	CURLMUX_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	// hidden
	CURLMUX_EXPORT boost::system::error_code make_error_code(http_errors e);

} // namespace errors

	// returns the error_category for curlmux errors
	CURLMUX_EXPORT boost::system::error_category& curlmux_category();

	// returns the error_category for HTTP status codes
	CURLMUX_EXPORT boost::system::error_category& http_category();

}

namespace boost { namespace system {

	template<> struct is_error_code_enum<curlmux::errors::error_code_enum>
	{ static const bool value = true; };

	template<> struct is_error_code_enum<curlmux::errors::http_errors>
	{ static const bool value = true; };
} }

#endif
