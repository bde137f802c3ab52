/*

Copyright (c) 2008-2009, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/config.hpp"
#include "curlmux/error_code.hpp"

#include <string>

namespace curlmux {

	struct curlmux_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* curlmux_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "curlmux";
	}

	std::string curlmux_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"invalid proxy authentication mechanism",
			"option is reserved by the scheduler",
			"transfer is registered with another scheduler",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	struct http_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "http"; }
		std::string message(int ev) const override
		{
			std::string ret;
			ret += std::to_string(ev);
			ret += " ";
			switch (ev)
			{
				case errors::cont: ret += "Continue"; break;
				case errors::ok: ret += "OK"; break;
				case errors::bad_request: ret += "Bad Request"; break;
				case errors::unauthorized: ret += "Unauthorized"; break;
				case errors::forbidden: ret += "Forbidden"; break;
				case errors::not_found: ret += "Not found"; break;
				case errors::proxy_authentication_required: ret += "Proxy Authentication Required"; break;
				case errors::internal_server_error: ret += "Internal server error"; break;
				case errors::not_implemented: ret += "Not implemented"; break;
				case errors::bad_gateway: ret += "Bad gateway"; break;
				case errors::service_unavailable: ret += "Service unavailable"; break;
				case errors::gateway_timeout: ret += "Gateway timeout"; break;
				default: ret += "(unknown HTTP error)"; break;
			}
			return ret;
		}
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	boost::system::error_category& curlmux_category()
	{
		static curlmux_error_category curlmux_category;
		return curlmux_category;
	}

	boost::system::error_category& http_category()
	{
		static http_error_category http_category;
		return http_category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, curlmux_category()};
		}

		boost::system::error_code make_error_code(http_errors e)
		{
			return {e, http_category()};
		}
	}

}
