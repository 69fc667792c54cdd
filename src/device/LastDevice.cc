/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/18/18.
//

#include "LastDevice.hh"

#include "util/AtomicFile.hh"
#include "util/Log.hh"

namespace pxr {

LastDevice::LastDevice(fs::path file) : m_file{std::move(file)}
{
}

std::optional<std::string> LastDevice::load() const
{
	std::error_code ec;
	if (!fs::exists(m_file, ec))
		return std::nullopt;

	auto json = read_json(m_file, ec);
	if (ec)
	{
		Log(LOG_DEBUG, "cannot load last device IP from %1%: %2%", m_file, ec.message());
		return std::nullopt;
	}

	auto ip = json.find("ip");
	return ip != json.end() && ip->is_string() ? std::optional<std::string>{ip->get<std::string>()} : std::nullopt;
}

void LastDevice::save(const std::string& ip, std::error_code& ec)
{
	write_json_atomic(m_file, {{"ip", ip}}, ec);
	if (!ec)
		Log(LOG_DEBUG, "saved %1% for next discovery", ip);
}

} // end of namespace pxr
