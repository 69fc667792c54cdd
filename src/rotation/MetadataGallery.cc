/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#include "MetadataGallery.hh"

#include "util/AtomicFile.hh"
#include "util/Log.hh"

namespace pxr {

MetadataGallery::MetadataGallery(fs::path dir) : m_dir{std::move(dir)}
{
}

nlohmann::json MetadataGallery::item(const std::string& id) const
{
	std::error_code ec;
	auto index = read_json(m_dir / "metadata.json", ec);
	if (ec)
	{
		Log(LOG_DEBUG, "cannot read gallery index in %1%: %2%", m_dir, ec.message());
		return {};
	}

	auto items = index.find("items");
	if (items == index.end() || !items->is_object())
		return {};

	auto it = items->find(id);
	return it != items->end() && it->is_object() ? *it : nlohmann::json{};
}

bool MetadataGallery::exists(const std::string& id) const
{
	return !item(id).is_null();
}

std::optional<fs::path> MetadataGallery::path(const std::string& id) const
{
	auto entry = item(id);
	auto filename = entry.is_object() ? entry.value("filename", std::string{}) : std::string{};
	if (filename.empty())
		return std::nullopt;

	auto file = m_dir / "gifs" / fs::path{filename}.filename();

	std::error_code ec;
	if (!fs::is_regular_file(file, ec))
		return std::nullopt;

	return file;
}

} // end of namespace pxr
