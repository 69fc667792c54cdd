/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 5/12/18.
//

#pragma once

#include "util/FS.hh"

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace pxr {

/// \brief  Reference counts of temporary files that are being read.
///
/// A file must not be deleted while its count is above zero. Files whose
/// count dropped to zero are remembered until forget(), so a periodic sweep
/// can find the ones nobody touched for a while.
class FileTracker
{
public:
	using Clock = std::chrono::steady_clock;

public:
	FileTracker() = default;

	void acquire(const fs::path& path, Clock::time_point now = Clock::now());

	/// Returns true if the file can be deleted, i.e. nobody else holds it.
	/// Releasing a file that was never acquired returns true.
	bool release(const fs::path& path);

	bool is_in_use(const fs::path& path) const;

	/// Files not in use that were last acquired more than \a ttl ago.
	std::vector<fs::path> stale_files(std::chrono::seconds ttl, Clock::time_point now = Clock::now()) const;

	void forget(const fs::path& path);

private:
	struct Reference
	{
		int                 count{};
		Clock::time_point   touched;
	};

	mutable std::mutex m_mutex;
	std::map<fs::path, Reference> m_refs;
};

/// Delete the files that exist and are not in use. Failures are logged.
void cleanup_files(const std::vector<fs::path>& paths, FileTracker& tracker);

} // end of namespace pxr
