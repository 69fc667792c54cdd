/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/18/18.
//

#pragma once

#include "util/FS.hh"

#include <optional>
#include <string>
#include <system_error>

namespace pxr {

/// The IP address of the device we connected to last time, saved in a
/// small JSON file so discovery can try it first.
class LastDevice
{
public:
	explicit LastDevice(fs::path file);

	/// Returns std::nullopt if nothing was saved or the file is unreadable.
	std::optional<std::string> load() const;
	void save(const std::string& ip, std::error_code& ec);

	const fs::path& path() const {return m_file;}

private:
	fs::path m_file;
};

} // end of namespace pxr
