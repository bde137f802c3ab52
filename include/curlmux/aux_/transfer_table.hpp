/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLMUX_TRANSFER_TABLE_HPP_INCLUDED
#define CURLMUX_TRANSFER_TABLE_HPP_INCLUDED

#include "curlmux/config.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace curlmux {
	class transfer;
}

namespace curlmux::aux {

	// maps the string key libcurl hands back in callback context to the
	// transfer object it belongs to. A multiplexer owns one for the
	// transfers added to it, transfers running standalone are registered
	// in standalone() for the duration of perform()
	class CURLMUX_EXTRA_EXPORT transfer_table
	{
	public:
		transfer_table() = default;
		transfer_table(transfer_table const&) = delete;
		transfer_table& operator=(transfer_table const&) = delete;

		static transfer_table& standalone();

		// returns false if ``key`` is already present
		bool insert(std::string const& key, transfer* t);
		bool erase(std::string const& key);
		transfer* find(std::string const& key) const;
		std::size_t size() const;
		std::vector<transfer*> all() const;

	private:
		mutable std::mutex m_mutex;
		std::unordered_map<std::string, transfer*> m_transfers;
	};

	// what libcurl callbacks receive as their userdata pointer. The table is
	// null while the transfer isn't running
	struct callback_context
	{
		std::string key;
		transfer_table const* table = nullptr;
	};

	// resolves callback userdata to the transfer it was registered for, or
	// nullptr
	CURLMUX_EXTRA_EXPORT transfer* transfer_from_context(void* userdata);
}

#endif
