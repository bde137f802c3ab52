/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_LOGGER_HPP_INCLUDED
#define CURLMUX_LOGGER_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <cstdio>
#include <mutex>

namespace curlmux {

	// the interface transfers and multiplexers report diagnostics through.
	// Implementations must be safe to call from several threads at once
	struct CURLMUX_EXPORT logger
	{
#ifndef CURLMUX_DISABLE_LOGGING
		virtual bool should_log() const = 0;
		virtual void log(char const* fmt, ...) const CURLMUX_FORMAT(2,3) = 0;
#endif
	protected:
		~logger() {}
	};

	// writes one timestamped line per call to a FILE*, stderr by default
	struct CURLMUX_EXPORT stderr_logger final : logger
	{
		explicit stderr_logger(FILE* out = stderr, bool enabled = true)
			: m_out(out), m_enabled(enabled) {}
#ifndef CURLMUX_DISABLE_LOGGING
		bool should_log() const override { return m_enabled; }
		void log(char const* fmt, ...) const override;
#endif
		void enable(bool e) { m_enabled = e; }

	private:
		FILE* m_out;
		bool m_enabled;
		mutable std::mutex m_mutex;
	};
}

#endif
