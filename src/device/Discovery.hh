/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 9/1/2020.
//

#pragma once

#include <boost/asio/ip/address_v4.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pxr {

class DeviceTransport;
class LastDevice;
class ServiceBrowser;
struct DiscoverySetting;

/// \brief  Finds displays on the local network.
///
/// Three strategies are tried in order and the first one that finds
/// anything wins: the device we connected to last time, mDNS browsing and
/// finally probing every host address of the local /24 subnet.
class Discovery
{
public:
	using LocalAddress = std::function<std::optional<boost::asio::ip::address_v4>()>;

public:
	Discovery(
		DeviceTransport& transport,
		const LastDevice& last,
		ServiceBrowser& browser,
		const DiscoverySetting& cfg,
		LocalAddress local = &Discovery::local_address
	);

	std::vector<std::string> discover();
	std::vector<std::string> discover(std::chrono::milliseconds timeout);

	/// True if \a ip answers the handshake with a success status.
	bool probe(const std::string& ip, std::chrono::milliseconds timeout);

	/// Probe prefix.1 to prefix.254 of the /24 subnet \a local belongs to.
	std::vector<std::string> sweep(boost::asio::ip::address_v4 local);

	/// The address the OS would use to reach the internet.
	static std::optional<boost::asio::ip::address_v4> local_address();

private:
	DeviceTransport&        m_transport;
	const LastDevice&       m_last;
	ServiceBrowser&         m_browser;
	const DiscoverySetting& m_cfg;
	LocalAddress            m_local;
};

} // end of namespace pxr
