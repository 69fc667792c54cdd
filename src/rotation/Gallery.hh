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

#include <optional>
#include <string>

namespace pxr {

/// The catalog of ready-to-show animations, keyed by item ID.
class Gallery
{
public:
	virtual ~Gallery() = default;

	virtual bool exists(const std::string& id) const = 0;

	/// The file of the item, or std::nullopt if the item or its file is gone.
	virtual std::optional<fs::path> path(const std::string& id) const = 0;
};

} // end of namespace pxr
