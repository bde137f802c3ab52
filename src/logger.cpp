/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/logger.hpp"

#include <chrono>
#include <cstdarg>
#include <ctime>
#include <thread>
#include <functional>

namespace curlmux {

#ifndef CURLMUX_DISABLE_LOGGING
	void stderr_logger::log(char const* fmt, ...) const
	{
		if (!m_enabled || m_out == nullptr) return;

		using namespace std::chrono;
		auto const now = system_clock::now();
		std::time_t const t = system_clock::to_time_t(now);
		auto const ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
		std::tm tm_buf{};
		localtime_r(&t, &tm_buf);
		char stamp[32];
		std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm_buf);

		auto const tid = std::hash<std::thread::id>()(std::this_thread::get_id()) % 100000;

		std::lock_guard<std::mutex> l(m_mutex);
		std::fprintf(m_out, "%s.%03d %05zu: ", stamp, int(ms), std::size_t(tid));
		va_list v;
		va_start(v, fmt);
		std::vfprintf(m_out, fmt, v);
		va_end(v);
		std::fputc('\n', m_out);
		std::fflush(m_out);
	}
#endif
}
