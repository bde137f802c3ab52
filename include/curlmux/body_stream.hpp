/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_BODY_STREAM_HPP_INCLUDED
#define CURLMUX_BODY_STREAM_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/error_code.hpp"
#include "curlmux/aux_/socket_io.hpp"

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <string>

namespace curlmux {

	// where a transfer reads its request body from
	struct CURLMUX_EXPORT body_source
	{
		// reads up to ``len`` bytes into ``buf`` and returns the number of
		// bytes read. 0 means end of stream. Failures are reported in ``ec``
		virtual std::size_t read(char* buf, std::size_t len, error_code& ec) = 0;
		virtual ~body_source() = default;
	};

	// where a transfer delivers response body or header bytes
	struct CURLMUX_EXPORT body_sink
	{
		// returns the number of bytes consumed. Failures are reported in
		// ``ec``
		virtual std::size_t write(char const* buf, std::size_t len, error_code& ec) = 0;
		virtual ~body_sink() = default;
	};

	class CURLMUX_EXPORT memory_source final : public body_source
	{
	public:
		explicit memory_source(std::string data) : m_data(std::move(data)) {}
		std::size_t read(char* buf, std::size_t len, error_code& ec) override;
		std::size_t remaining() const { return m_data.size() - m_pos; }
	private:
		std::string m_data;
		std::size_t m_pos = 0;
	};

	class CURLMUX_EXPORT memory_sink final : public body_sink
	{
	public:
		std::size_t write(char const* buf, std::size_t len, error_code& ec) override;
		std::string const& data() const { return m_data; }
		void clear() { m_data.clear(); }
	private:
		std::string m_data;
	};

	// reads from a connected socket. The descriptor is not owned. Throws
	// system_error if ``fd`` can't be used
	class CURLMUX_EXPORT socket_source final : public body_source
	{
	public:
		explicit socket_source(int fd);
		std::size_t read(char* buf, std::size_t len, error_code& ec) override;
	private:
		boost::asio::io_context m_ios;
		aux::borrowed_descriptor m_desc;
	};

	// writes everything it is given to a connected socket, blocking until it
	// is sent. The descriptor is not owned. Throws system_error if ``fd``
	// can't be used
	class CURLMUX_EXPORT socket_sink final : public body_sink
	{
	public:
		explicit socket_sink(int fd);
		std::size_t write(char const* buf, std::size_t len, error_code& ec) override;
	private:
		boost::asio::io_context m_ios;
		aux::borrowed_descriptor m_desc;
	};
}

#endif
