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

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace pxr {

class FileTracker;

/// \brief  Uploads in progress, keyed by a short random ID.
///
/// Each entry is a JSON object owned by the ingestion workflow. An entry
/// older than the TTL is treated as absent and deleted on access. Deleting
/// an entry also deletes the files named by its "path" and
/// "converted_path" fields unless they are still in use.
class UploadRegistry
{
public:
	using Clock = std::chrono::steady_clock;

public:
	UploadRegistry(std::chrono::seconds ttl, std::string name, FileTracker& tracker);
	UploadRegistry(const UploadRegistry&) = delete;
	UploadRegistry& operator=(const UploadRegistry&) = delete;

	void set(const std::string& id, nlohmann::json data, Clock::time_point now = Clock::now());
	std::optional<nlohmann::json> get(const std::string& id, Clock::time_point now = Clock::now());

	/// Merge \a fields into an entry. Returns false if there is no such entry.
	bool update(const std::string& id, const nlohmann::json& fields, Clock::time_point now = Clock::now());
	bool remove(const std::string& id);
	bool exists(const std::string& id, Clock::time_point now = Clock::now());

	/// Returns the number of entries removed.
	std::size_t cleanup_expired(Clock::time_point now = Clock::now());

	/// Including expired entries not yet cleaned up.
	std::size_t count() const;
	std::size_t clear();

	const std::string& name() const {return m_name;}
	std::chrono::seconds ttl() const {return m_ttl;}

private:
	struct Entry
	{
		nlohmann::json      data;
		Clock::time_point   created;
	};

	bool expired(const Entry& entry, Clock::time_point now) const;
	void erase(std::map<std::string, Entry>::iterator it);

private:
	std::chrono::seconds    m_ttl;
	std::string             m_name;
	FileTracker&            m_tracker;

	mutable std::mutex m_mutex;
	std::map<std::string, Entry> m_entries;
};

/// A new 8-character lower case hex upload ID.
std::string new_upload_id();

/// Fails with Error::invalid_upload_id unless \a id is 8 lower case hex digits.
std::error_code validate_upload_id(std::string_view id);

} // end of namespace pxr
