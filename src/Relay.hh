/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/16/18.
//

#pragma once

#include "device/DeviceConnection.hh"
#include "device/Discovery.hh"
#include "device/FrameUploader.hh"
#include "device/DeviceTransport.hh"
#include "device/LastDevice.hh"
#include "device/MDNSBrowser.hh"
#include "rotation/MetadataGallery.hh"
#include "rotation/RotationConfig.hh"
#include "rotation/RotationScheduler.hh"
#include "upload/FileTracker.hh"
#include "upload/UploadRegistry.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>

namespace pxr {

class Configuration;

/// \brief  Owns every service of the process and wires them together.
///
/// Construct one instance at start-up. Consumers get references to the
/// parts they need. Blocking device I/O runs on the worker pool so that
/// it never holds up the event loop. The transport must outlive the relay.
class Relay
{
public:
	Relay(const Configuration& cfg, DeviceTransport& transport);
	Relay(const Relay&) = delete;
	Relay& operator=(const Relay&) = delete;

	boost::asio::io_context& get_io_context() {return m_ioc;}
	boost::asio::thread_pool& get_pool() {return m_pool;}

	DeviceConnection& device() {return m_device;}
	Discovery& discovery() {return m_discovery;}
	FrameUploader& uploader() {return m_uploader;}
	RotationScheduler& rotation() {return m_rotation;}
	UploadRegistry& uploads() {return m_uploads;}
	FileTracker& files() {return m_files;}
	const Gallery& gallery() const {return m_gallery;}

	/// Periodically drop expired uploads, delete stale temporary files and
	/// reconnect to the last device while a rotation waits for it.
	void start_housekeeping();
	void housekeeping();

	/// Stop the rotation (keeping its config) and the housekeeping timer.
	void shutdown();

private:
	void schedule_housekeeping();
	void reconnect();

private:
	const Configuration&    m_cfg;
	boost::asio::io_context m_ioc;

	DeviceTransport&    m_transport;
	LastDevice          m_last;
	DeviceConnection    m_device;
	MDNSBrowser         m_browser;
	Discovery           m_discovery;
	FrameUploader       m_uploader;
	MetadataGallery     m_gallery;
	RotationStore       m_rotation_store;
	FileTracker         m_files;
	UploadRegistry      m_uploads;

	// destroyed after m_rotation has cancelled its task
	boost::asio::thread_pool    m_pool;
	RotationScheduler           m_rotation;

	boost::asio::steady_timer   m_housekeeping{m_ioc};
	std::atomic<bool>           m_reconnecting{false};
};

} // end of namespace pxr
