/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 5/12/18.
//

#include "FileTracker.hh"

#include "util/Log.hh"

namespace pxr {

void FileTracker::acquire(const fs::path& path, Clock::time_point now)
{
	std::unique_lock lock{m_mutex};
	auto& ref = m_refs[path];
	++ref.count;
	ref.touched = now;
}

bool FileTracker::release(const fs::path& path)
{
	std::unique_lock lock{m_mutex};
	auto it = m_refs.find(path);
	if (it == m_refs.end())
		return true;

	if (it->second.count > 0)
		--it->second.count;

	return it->second.count == 0;
}

bool FileTracker::is_in_use(const fs::path& path) const
{
	std::unique_lock lock{m_mutex};
	auto it = m_refs.find(path);
	return it != m_refs.end() && it->second.count > 0;
}

std::vector<fs::path> FileTracker::stale_files(std::chrono::seconds ttl, Clock::time_point now) const
{
	std::vector<fs::path> result;

	std::unique_lock lock{m_mutex};
	for (auto&& [path, ref] : m_refs)
		if (ref.count == 0 && now - ref.touched > ttl)
			result.push_back(path);

	return result;
}

void FileTracker::forget(const fs::path& path)
{
	std::unique_lock lock{m_mutex};
	if (auto it = m_refs.find(path); it != m_refs.end() && it->second.count == 0)
		m_refs.erase(it);
}

void cleanup_files(const std::vector<fs::path>& paths, FileTracker& tracker)
{
	for (auto&& path : paths)
	{
		if (path.empty())
			continue;

		if (tracker.is_in_use(path))
		{
			Log(LOG_DEBUG, "%1% is in use, not deleted", path);
			continue;
		}

		std::error_code ec;
		if (fs::remove(path, ec))
			Log(LOG_DEBUG, "removed %1%", path);
		else if (ec)
			Log(LOG_WARNING, "cannot remove %1%: %2%", path, ec.message());

		tracker.forget(path);
	}
}

} // end of namespace pxr
