/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#pragma once

#include "util/FS.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace pxr {

/// What the user asked to rotate, saved so it can be resumed after a restart.
struct RotationConfig
{
	static constexpr int version = 1;

	std::vector<std::string>    selected_ids;
	int                         interval_seconds{};
	Timestamp                   updated_at;
};

void to_json(nlohmann::json& json, const RotationConfig& config);
void from_json(const nlohmann::json& json, RotationConfig& config);

class RotationStore
{
public:
	explicit RotationStore(fs::path file);

	/// Returns std::nullopt without error if nothing is saved. A file
	/// written by another version is ignored.
	std::optional<RotationConfig> load(std::error_code& ec) const;
	void save(const RotationConfig& config, std::error_code& ec);

	/// Removing a file that does not exist is not an error.
	void remove(std::error_code& ec);
	bool exists() const;

	const fs::path& path() const {return m_file;}

private:
	fs::path m_file;
};

} // end of namespace pxr
