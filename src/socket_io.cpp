/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/socket_io.hpp"
#include "curlmux/aux_/throw.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <memory>

namespace curlmux::aux {

namespace {

	template <typename T>
	bool contains(std::vector<T> const& v, T const& e)
	{
		return std::find(v.begin(), v.end(), e) != v.end();
	}

	template <typename T>
	void insert(std::vector<T>& v, T const& e)
	{
		if (!contains(v, e)) v.push_back(e);
	}

	// descriptors whose wait completed, by kind of wait
	struct completions
	{
		std::vector<descriptor*> read;
		std::vector<descriptor*> write;
		std::vector<descriptor*> error;
		std::vector<descriptor*> failed;
	};

	void post_wait(descriptor* d, descriptor::wait_type const w
		, std::vector<descriptor*>& done, std::vector<descriptor*>& failed)
	{
		d->async_wait(w, [d, &done, &failed](error_code const& e)
		{
			// the wait is over, nothing is recorded for canceled waits
			if (e == boost::asio::error::operation_aborted) return;
			insert(e ? failed : done, d);
		});
	}
}

	borrowed_descriptor::borrowed_descriptor(boost::asio::io_context& ios
		, int const fd, error_code& ec)
		: m_desc(ios)
		, m_fd(fd)
	{
		m_desc.assign(fd, ec);
	}

	borrowed_descriptor::borrowed_descriptor(boost::asio::io_context& ios, int const fd)
		: m_desc(ios)
		, m_fd(fd)
	{
		error_code ec;
		m_desc.assign(fd, ec);
		if (ec) aux::throw_ex<system_error>(ec);
	}

	borrowed_descriptor::~borrowed_descriptor()
	{
		if (m_desc.is_open()) m_desc.release();
	}

	readiness wait_readiness(boost::asio::io_context& ios
		, std::vector<descriptor*> const& rlist
		, std::vector<descriptor*> const& wlist
		, std::vector<descriptor*> const& xlist
		, std::optional<std::chrono::milliseconds> const timeout
		, error_code& ec)
	{
		ec.clear();
		readiness ret;
		if (rlist.empty() && wlist.empty() && xlist.empty()) return ret;

		ios.restart();
		completions done;

		std::vector<descriptor*> all;
		for (descriptor* d : rlist) insert(all, d);
		for (descriptor* d : all)
			post_wait(d, descriptor::wait_read, done.read, done.failed);

		std::vector<descriptor*> writers;
		for (descriptor* d : wlist) insert(writers, d);
		for (descriptor* d : writers)
		{
			post_wait(d, descriptor::wait_write, done.write, done.failed);
			insert(all, d);
		}

		std::vector<descriptor*> errors;
		for (descriptor* d : xlist) insert(errors, d);
		for (descriptor* d : errors)
		{
			post_wait(d, descriptor::wait_error, done.error, done.failed);
			insert(all, d);
		}

		try
		{
			std::size_t const n = timeout
				? ios.run_one_for(std::max(*timeout, std::chrono::milliseconds(0)))
				: ios.run_one();

			// pick up everything else that became ready at the same time
			if (n > 0) ios.poll();
		}
		catch (system_error const& e)
		{
			ec = e.code();
		}

		// the handlers refer to this stack frame. Run the canceled ones
		// before returning
		for (descriptor* d : all)
		{
			error_code ignore;
			d->cancel(ignore);
		}
		ios.restart();
		ios.poll();

		if (ec) return {};

		// read descriptors before write descriptors before exceptional ones
		for (descriptor* d : rlist)
		{
			if (contains(done.read, d) || contains(done.failed, d))
				insert(ret.read, d->native_handle());
		}
		for (descriptor* d : wlist)
		{
			// a failed socket is reported writable so the next write finds
			// out why
			if (contains(done.write, d) || contains(done.failed, d))
				insert(ret.write, d->native_handle());
		}
		for (descriptor* d : xlist)
		{
			// a hang-up completes every kind of wait. On a descriptor also
			// waited on for reading it is reported as readable only
			if (contains(done.failed, d)
				|| (contains(done.error, d) && !contains(done.read, d)))
				insert(ret.error, d->native_handle());
		}
		return ret;
	}

	readiness wait_readiness(boost::asio::io_context& ios
		, std::vector<int> const& rlist
		, std::vector<int> const& wlist
		, std::vector<int> const& xlist
		, std::optional<std::chrono::milliseconds> const timeout
		, error_code& ec)
	{
		ec.clear();

		// each descriptor is registered with the reactor once, however many
		// lists it is in
		std::vector<std::unique_ptr<borrowed_descriptor>> borrowed;
		auto lookup = [&](int const fd) -> descriptor*
		{
			for (auto& b : borrowed)
				if (b->fd() == fd) return &b->get();
			borrowed.push_back(std::make_unique<borrowed_descriptor>(ios, fd, ec));
			return &borrowed.back()->get();
		};

		std::vector<descriptor*> r;
		std::vector<descriptor*> w;
		std::vector<descriptor*> x;
		for (int const fd : rlist)
		{
			r.push_back(lookup(fd));
			if (ec) return {};
		}
		for (int const fd : wlist)
		{
			w.push_back(lookup(fd));
			if (ec) return {};
		}
		for (int const fd : xlist)
		{
			x.push_back(lookup(fd));
			if (ec) return {};
		}

		return wait_readiness(ios, r, w, x, timeout, ec);
	}

	std::size_t read_some(descriptor& d, char* buf, std::size_t const len, error_code& ec)
	{
		std::size_t const n = d.read_some(boost::asio::buffer(buf, len), ec);
		if (ec == boost::asio::error::eof)
		{
			ec.clear();
			return 0;
		}
		return n;
	}

	std::size_t write_some(descriptor& d, char const* buf, std::size_t const len, error_code& ec)
	{
		std::size_t const n = d.write_some(boost::asio::buffer(buf, len), ec);
		if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again)
		{
			ec.clear();
			return 0;
		}
		return n;
	}

	void write_all(descriptor& d, char const* buf, std::size_t const len, error_code& ec)
	{
		boost::asio::write(d, boost::asio::buffer(buf, len), ec);
	}
}
