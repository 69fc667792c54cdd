/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 9/1/2020.
//

#include "Discovery.hh"

#include "DeviceTransport.hh"
#include "LastDevice.hh"
#include "Protocol.hh"
#include "ServiceBrowser.hh"

#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <mutex>

namespace pxr {

namespace {

void sort_by_address(std::vector<std::string>& ips)
{
	auto key = [](const std::string& ip)
	{
		boost::system::error_code ec;
		auto addr = boost::asio::ip::make_address_v4(ip, ec);
		return ec ? 0U : addr.to_uint();
	};
	std::sort(ips.begin(), ips.end(), [&key](auto& a, auto& b){return key(a) < key(b);});
	ips.erase(std::unique(ips.begin(), ips.end()), ips.end());
}

} // end of local namespace

Discovery::Discovery(
	DeviceTransport& transport,
	const LastDevice& last,
	ServiceBrowser& browser,
	const DiscoverySetting& cfg,
	LocalAddress local
) :
	m_transport{transport}, m_last{last}, m_browser{browser}, m_cfg{cfg}, m_local{std::move(local)}
{
}

std::vector<std::string> Discovery::discover()
{
	return discover(m_cfg.timeout);
}

std::vector<std::string> Discovery::discover(std::chrono::milliseconds timeout)
{
	if (auto last = m_last.load(); last && probe(*last, m_cfg.last_ip_timeout))
	{
		Log(LOG_INFO, "last connected device %1% is still alive", *last);
		return {*last};
	}

	std::error_code ec;
	auto found = m_browser.browse(m_cfg.service_type, timeout, ec);
	if (ec)
		Log(LOG_NOTICE, "mDNS browsing failed: %1%", ec.message());
	if (!found.empty())
	{
		Log(LOG_INFO, "mDNS found %1% device(s)", found.size());
		sort_by_address(found);
		return found;
	}

	std::optional<boost::asio::ip::address_v4> local;
	if (m_local)
		local = m_local();
	if (!local)
	{
		Log(LOG_WARNING, "cannot determine local address, no subnet to sweep");
		return {};
	}
	return sweep(*local);
}

bool Discovery::probe(const std::string& ip, std::chrono::milliseconds timeout)
{
	auto session = m_transport.open(ip);
	if (!session)
		return false;

	std::error_code ec;
	auto response = session->post(protocol::handshake(), timeout, ec);
	return !ec && protocol::status(response) == 0;
}

std::vector<std::string> Discovery::sweep(boost::asio::ip::address_v4 local)
{
	auto prefix = local.to_uint() & 0xFFFFFF00U;
	Log(LOG_INFO, "sweeping subnet %1%/24", boost::asio::ip::address_v4{prefix});

	std::mutex mutex;
	std::vector<std::string> found;

	boost::asio::thread_pool pool{std::max<std::size_t>(m_cfg.workers, 1)};
	for (auto host = 1U; host < 255U; ++host)
	{
		boost::asio::post(pool, [this, &mutex, &found, ip=boost::asio::ip::address_v4{prefix | host}.to_string()]
		{
			if (probe(ip, m_cfg.probe_timeout))
			{
				std::unique_lock lock{mutex};
				found.push_back(ip);
			}
		});
	}
	pool.join();

	sort_by_address(found);
	Log(LOG_INFO, "subnet sweep found %1% device(s)", found.size());
	return found;
}

std::optional<boost::asio::ip::address_v4> Discovery::local_address()
{
	using udp = boost::asio::ip::udp;

	// connect() on a UDP socket only picks a route, nothing is sent
	boost::asio::io_context ioc;
	udp::socket socket{ioc};
	boost::system::error_code ec;
	socket.connect(udp::endpoint{boost::asio::ip::make_address_v4("8.8.8.8"), 80}, ec);
	if (ec)
		return std::nullopt;

	auto local = socket.local_endpoint(ec);
	if (ec || !local.address().is_v4())
		return std::nullopt;

	return local.address().to_v4();
}

} // end of namespace pxr
