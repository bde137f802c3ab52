/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_SOCKET_IO_HPP_INCLUDED
#define CURLMUX_SOCKET_IO_HPP_INCLUDED

#include "curlmux/config.hpp"
#include "curlmux/error_code.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace curlmux::aux {

	using descriptor = boost::asio::posix::stream_descriptor;

	// descriptors a readiness wait reported, in the order they were
	// passed in
	struct readiness
	{
		std::vector<int> read;
		std::vector<int> write;
		std::vector<int> error;

		bool empty() const { return read.empty() && write.empty() && error.empty(); }
	};

	// a socket owned by someone else (libcurl or the application), wrapped
	// for the lifetime of this object. It is released on destruction, never
	// closed
	struct CURLMUX_EXTRA_EXPORT borrowed_descriptor
	{
		borrowed_descriptor(boost::asio::io_context& ios, int fd, error_code& ec);
		borrowed_descriptor(boost::asio::io_context& ios, int fd);
		~borrowed_descriptor();

		borrowed_descriptor(borrowed_descriptor const&) = delete;
		borrowed_descriptor& operator=(borrowed_descriptor const&) = delete;

		descriptor& get() { return m_desc; }
		int fd() const { return m_fd; }

	private:
		descriptor m_desc;
		int m_fd;
	};

	// waits until a descriptor in ``rlist`` is readable, one in ``wlist`` is
	// writable, one in ``xlist`` reports an exceptional condition
	// (out-of-band data, a hang-up or a failed wait), or the timeout
	// expires. An empty optional timeout waits indefinitely. A hang-up on a
	// descriptor that is also in ``rlist`` is reported as readable, not as
	// exceptional. Every descriptor must be associated with ``ios``, and
	// nothing else may run on ``ios`` during the wait. Waiting puts the
	// descriptors in non-blocking mode. A timeout returns an empty result,
	// so do all empty lists
	CURLMUX_EXTRA_EXPORT readiness wait_readiness(boost::asio::io_context& ios
		, std::vector<descriptor*> const& rlist
		, std::vector<descriptor*> const& wlist
		, std::vector<descriptor*> const& xlist
		, std::optional<std::chrono::milliseconds> timeout
		, error_code& ec);

	// borrows every descriptor in the three lists for the duration of the
	// wait
	CURLMUX_EXTRA_EXPORT readiness wait_readiness(boost::asio::io_context& ios
		, std::vector<int> const& rlist
		, std::vector<int> const& wlist
		, std::vector<int> const& xlist
		, std::optional<std::chrono::milliseconds> timeout
		, error_code& ec);

	// a single read. Returns 0 when the peer closed the connection. A
	// non-blocking descriptor with nothing to read fails with
	// boost::asio::error::would_block
	CURLMUX_EXTRA_EXPORT std::size_t read_some(descriptor& d, char* buf, std::size_t len, error_code& ec);

	// a single write. On a non-blocking descriptor a full socket buffer is
	// not an error, it returns 0
	CURLMUX_EXTRA_EXPORT std::size_t write_some(descriptor& d, char const* buf, std::size_t len, error_code& ec);

	// writes all of ``buf``, waiting for the descriptor to become writable
	// whenever its buffer is full. ``d`` must not be in non-blocking mode
	CURLMUX_EXTRA_EXPORT void write_all(descriptor& d, char const* buf, std::size_t len, error_code& ec);
}

#endif
