/*

Copyright (c) 2026, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlmux/aux_/transfer_table.hpp"

namespace curlmux::aux {

	transfer_table& transfer_table::standalone()
	{
		static transfer_table table;
		return table;
	}

	bool transfer_table::insert(std::string const& key, transfer* t)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_transfers.emplace(key, t).second;
	}

	bool transfer_table::erase(std::string const& key)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_transfers.erase(key) > 0;
	}

	transfer* transfer_table::find(std::string const& key) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto const i = m_transfers.find(key);
		if (i == m_transfers.end()) return nullptr;
		return i->second;
	}

	std::size_t transfer_table::size() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_transfers.size();
	}

	std::vector<transfer*> transfer_table::all() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		std::vector<transfer*> ret;
		ret.reserve(m_transfers.size());
		for (auto const& e : m_transfers) ret.push_back(e.second);
		return ret;
	}

	transfer* transfer_from_context(void* userdata)
	{
		auto const* ctx = static_cast<callback_context const*>(userdata);
		if (ctx == nullptr || ctx->table == nullptr) return nullptr;
		return ctx->table->find(ctx->key);
	}
}
