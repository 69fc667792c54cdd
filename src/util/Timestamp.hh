/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the pixoo_relay
	distribution for more details.
*/

//
// Created by nestal on 5/27/18.
//

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace pxr {

using TimePointBase = std::chrono::time_point<
    std::chrono::system_clock,
	std::chrono::milliseconds
>;

/// \brief  Wall clock time in milliseconds since the unix epoch.
/// Saved in files as ISO-8601 UTC strings, e.g. "2026-10-19T08:15:30.125Z".
struct Timestamp : TimePointBase
{
	using time_point::time_point;
	Timestamp() = default;
	Timestamp(TimePointBase tp) : Timestamp{tp.time_since_epoch()} {}

	static Timestamp now();
	static std::optional<Timestamp> from_iso8601(std::string_view str);

	std::string iso8601() const;
};

void to_json(nlohmann::json& json, const Timestamp& input);
void from_json(const nlohmann::json& json, Timestamp& output);

std::ostream& operator<<(std::ostream& os, Timestamp tp);

} // end of namespace pxr
