/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#include "RotationConfig.hh"

#include "util/AtomicFile.hh"
#include "util/Error.hh"
#include "util/Log.hh"

namespace pxr {

void to_json(nlohmann::json& json, const RotationConfig& config)
{
	json = nlohmann::json{
		{"version",             RotationConfig::version},
		{"selected_ids",        config.selected_ids},
		{"interval_seconds",    config.interval_seconds},
		{"updated_at",          config.updated_at}
	};
}

void from_json(const nlohmann::json& json, RotationConfig& config)
{
	json.at("selected_ids").get_to(config.selected_ids);
	json.at("interval_seconds").get_to(config.interval_seconds);
	if (auto it = json.find("updated_at"); it != json.end())
		it->get_to(config.updated_at);
}

RotationStore::RotationStore(fs::path file) : m_file{std::move(file)}
{
}

std::optional<RotationConfig> RotationStore::load(std::error_code& ec) const
{
	ec.clear();
	if (!exists())
		return std::nullopt;

	auto json = read_json(m_file, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot read rotation config %1%: %2%", m_file, ec.message());
		return std::nullopt;
	}

	try
	{
		if (!json.is_object() || json.value("version", 0) != RotationConfig::version)
		{
			Log(LOG_NOTICE, "ignoring rotation config %1% of unknown version", m_file);
			return std::nullopt;
		}
		return json.get<RotationConfig>();
	}
	catch (nlohmann::json::exception& e)
	{
		Log(LOG_WARNING, "invalid rotation config %1%: %2%", m_file, e.what());
		ec = Error::invalid_config;
		return std::nullopt;
	}
}

void RotationStore::save(const RotationConfig& config, std::error_code& ec)
{
	write_json_atomic(m_file, config, ec);
}

void RotationStore::remove(std::error_code& ec)
{
	fs::remove(m_file, ec);
	if (ec)
		Log(LOG_WARNING, "cannot remove rotation config %1%: %2%", m_file, ec.message());
}

bool RotationStore::exists() const
{
	std::error_code ec;
	return fs::exists(m_file, ec);
}

} // end of namespace pxr
