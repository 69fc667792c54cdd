/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 5/12/18.
//

#include "UploadRegistry.hh"
#include "FileTracker.hh"

#include "util/Error.hh"
#include "util/Log.hh"
#include "util/Random.hh"

#include <algorithm>

namespace pxr {

UploadRegistry::UploadRegistry(std::chrono::seconds ttl, std::string name, FileTracker& tracker) :
	m_ttl{ttl}, m_name{std::move(name)}, m_tracker{tracker}
{
}

void UploadRegistry::set(const std::string& id, nlohmann::json data, Clock::time_point now)
{
	std::unique_lock lock{m_mutex};
	m_entries.insert_or_assign(id, Entry{std::move(data), now});
}

std::optional<nlohmann::json> UploadRegistry::get(const std::string& id, Clock::time_point now)
{
	std::unique_lock lock{m_mutex};
	auto it = m_entries.find(id);
	if (it == m_entries.end())
		return std::nullopt;

	if (expired(it->second, now))
	{
		Log(LOG_DEBUG, "%1%: upload %2% expired", m_name, id);
		erase(it);
		return std::nullopt;
	}
	return it->second.data;
}

bool UploadRegistry::update(const std::string& id, const nlohmann::json& fields, Clock::time_point now)
{
	std::unique_lock lock{m_mutex};
	auto it = m_entries.find(id);
	if (it == m_entries.end() || expired(it->second, now) || !fields.is_object())
		return false;

	if (!it->second.data.is_object())
		it->second.data = nlohmann::json::object();

	it->second.data.update(fields);
	return true;
}

bool UploadRegistry::remove(const std::string& id)
{
	std::unique_lock lock{m_mutex};
	auto it = m_entries.find(id);
	if (it == m_entries.end())
		return false;

	erase(it);
	return true;
}

bool UploadRegistry::exists(const std::string& id, Clock::time_point now)
{
	return get(id, now).has_value();
}

std::size_t UploadRegistry::cleanup_expired(Clock::time_point now)
{
	std::unique_lock lock{m_mutex};

	std::size_t removed = 0;
	for (auto it = m_entries.begin(); it != m_entries.end();)
	{
		auto current = it++;
		if (expired(current->second, now))
		{
			erase(current);
			++removed;
		}
	}

	if (removed > 0)
		Log(LOG_INFO, "%1%: removed %2% expired upload(s)", m_name, removed);
	return removed;
}

std::size_t UploadRegistry::count() const
{
	std::unique_lock lock{m_mutex};
	return m_entries.size();
}

std::size_t UploadRegistry::clear()
{
	std::unique_lock lock{m_mutex};
	auto total = m_entries.size();
	while (!m_entries.empty())
		erase(m_entries.begin());
	return total;
}

bool UploadRegistry::expired(const Entry& entry, Clock::time_point now) const
{
	return now - entry.created > m_ttl;
}

void UploadRegistry::erase(std::map<std::string, Entry>::iterator it)
{
	std::vector<fs::path> files;
	if (it->second.data.is_object())
	{
		for (auto field : {"path", "converted_path"})
		{
			auto f = it->second.data.find(field);
			if (f != it->second.data.end() && f->is_string() && !f->get<std::string>().empty())
				files.emplace_back(f->get<std::string>());
		}
	}
	cleanup_files(files, m_tracker);

	m_entries.erase(it);
}

std::string new_upload_id()
{
	return random_hex(4);
}

std::error_code validate_upload_id(std::string_view id)
{
	auto hex = [](char c){return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');};
	if (id.size() != 8 || !std::all_of(id.begin(), id.end(), hex))
		return Error::invalid_upload_id;

	return {};
}

} // end of namespace pxr
