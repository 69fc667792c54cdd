/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the pixoo_relay
	distribution for more details.
*/

//
// Created by nestal on 6/3/18.
//

#pragma once

#include "DeviceTransport.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/system/error_code.hpp>

#include <mutex>
#include <string>

namespace pxr {

struct DeviceSetting;

/// HTTP/1.1 session that keeps its TCP connection alive between commands.
/// All I/O is done on a private io_context, so post() blocks the calling
/// thread and never touches the application's event loop.
class HTTPSession : public DeviceSession
{
public:
	HTTPSession(boost::asio::ip::tcp::endpoint remote, std::string target);
	~HTTPSession() override;

	nlohmann::json post(const nlohmann::json& command, std::chrono::milliseconds timeout, std::error_code& ec) override;

	const boost::asio::ip::tcp::endpoint& remote() const {return m_remote;}

private:
	nlohmann::json round_trip(const std::string& body, std::chrono::milliseconds timeout, std::error_code& ec);
	void disconnect();

	template <typename AsyncOp>
	boost::system::error_code run(AsyncOp&& op);

private:
	std::mutex m_mutex;

	boost::asio::io_context         m_ioc;
	boost::beast::tcp_stream        m_stream{m_ioc};
	boost::beast::flat_buffer       m_buffer;   // (Must persist between reads)

	boost::asio::ip::tcp::endpoint  m_remote;
	std::string                     m_target;
};

class HTTPTransport : public DeviceTransport
{
public:
	explicit HTTPTransport(const DeviceSetting& cfg);

	std::shared_ptr<DeviceSession> open(const std::string& ip) override;

private:
	const DeviceSetting& m_cfg;
};

/// Translate socket errors to the three failure classes of DeviceSession::post().
std::error_code classify(boost::system::error_code ec);

} // end of namespace pxr
