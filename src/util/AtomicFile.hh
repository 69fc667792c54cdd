/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 3/3/18.
//

#pragma once

#include "FS.hh"

#include <nlohmann/json.hpp>

#include <string_view>
#include <system_error>

namespace pxr {

/// \brief  Replace the content of \a dest without ever leaving a half-written file.
///
/// The data is written to a temporary file in the same directory, flushed to
/// disk and then renamed over \a dest. The parent directory is created if
/// it does not exist. On failure the temporary file is removed and \a dest
/// is left untouched.
void write_atomic(const fs::path& dest, std::string_view data, std::error_code& ec);

void write_json_atomic(const fs::path& dest, const nlohmann::json& json, std::error_code& ec);

/// Returns a discarded value and sets \a ec if the file cannot be read or parsed.
nlohmann::json read_json(const fs::path& src, std::error_code& ec);

} // end of namespace pxr
