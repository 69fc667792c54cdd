/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/16/18.
//

#include "Relay.hh"

#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>

#include <algorithm>

namespace pxr {

Relay::Relay(const Configuration& cfg, DeviceTransport& transport) :
	m_cfg{cfg},
	m_transport{transport},
	m_last{cfg.last_connection_file()},
	m_device{m_transport, cfg.connection(), &m_last},
	m_discovery{m_transport, m_last, m_browser, cfg.discovery()},
	m_uploader{m_device, cfg.device()},
	m_gallery{cfg.gallery_dir()},
	m_rotation_store{cfg.rotation_config_file()},
	m_uploads{cfg.upload_ttl(), "uploads", m_files},
	m_pool{std::max<std::size_t>(cfg.thread_count(), 1)},
	m_rotation{m_ioc, m_pool, m_device, m_uploader, m_gallery, m_rotation_store, cfg.rotation()}
{
	// the last device and rotation records live in data_dir
	ensure_directory(cfg.data_dir());
	ensure_directory(cfg.temp_dir());
}

void Relay::start_housekeeping()
{
	schedule_housekeeping();
}

void Relay::schedule_housekeeping()
{
	m_housekeeping.expires_after(m_cfg.rotation().reconnect_poll);
	m_housekeeping.async_wait([this](boost::system::error_code ec)
	{
		if (ec)
			return;

		housekeeping();
		schedule_housekeeping();
	});
}

void Relay::housekeeping()
{
	m_uploads.cleanup_expired();
	cleanup_files(m_files.stale_files(m_cfg.upload_ttl()), m_files);

	if (m_rotation.is_active() && !m_device.is_connected())
		reconnect();
}

void Relay::reconnect()
{
	// one attempt at a time
	if (m_reconnecting.exchange(true))
		return;

	boost::asio::post(m_pool, [this]
	{
		if (auto ip = m_last.load(); ip && !m_device.is_connected())
		{
			std::error_code ec;
			m_device.connect(*ip, ec);
			if (ec)
				Log(LOG_DEBUG, "reconnecting to %1%: %2%", *ip, ec.message());
		}
		m_reconnecting = false;
	});
}

void Relay::shutdown()
{
	if (auto ec = m_rotation.stop(); ec && ec != Error::rotation_inactive)
		Log(LOG_WARNING, "cannot save rotation config on shutdown: %1%", ec.message());

	m_housekeeping.cancel();
}

} // end of namespace pxr
