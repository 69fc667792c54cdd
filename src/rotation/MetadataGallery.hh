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

#include "Gallery.hh"

#include <nlohmann/json.hpp>

namespace pxr {

/// \brief  Read-only view of a gallery directory.
///
/// The directory holds an index file "metadata.json" of the form
/// `{"items": {"<id>": {"filename": "<name>", ...}}}` and the files
/// themselves under "gifs/". The index is re-read on every lookup because
/// another process owns it.
class MetadataGallery : public Gallery
{
public:
	explicit MetadataGallery(fs::path dir);

	bool exists(const std::string& id) const override;
	std::optional<fs::path> path(const std::string& id) const override;

	const fs::path& dir() const {return m_dir;}

private:
	nlohmann::json item(const std::string& id) const;

private:
	fs::path m_dir;
};

} // end of namespace pxr
