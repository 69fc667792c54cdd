/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the pixoo_relay
	distribution for more details.
*/

//
// Created by nestal on 6/3/18.
//

#include "HTTPTransport.hh"
#include "Protocol.hh"

#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace pxr {

namespace http = boost::beast::http;    // from <boost/beast/http.hpp>
using tcp = boost::asio::ip::tcp;       // from <boost/asio/ip/tcp.hpp>

std::error_code classify(boost::system::error_code ec)
{
	if (!ec)
		return {};

	// boost::beast::tcp_stream reports its own timer as beast::error::timeout
	if (ec == boost::beast::error::timeout || ec == boost::asio::error::timed_out)
		return Error::device_timeout;

	// refused, reset, unreachable, closed by peer...
	return Error::device_unreachable;
}

HTTPSession::HTTPSession(tcp::endpoint remote, std::string target) :
	m_remote{std::move(remote)}, m_target{std::move(target)}
{
}

HTTPSession::~HTTPSession()
{
	disconnect();
}

// Run one asynchronous operation to completion on the private io_context.
template <typename AsyncOp>
boost::system::error_code HTTPSession::run(AsyncOp&& op)
{
	boost::system::error_code result;
	std::forward<AsyncOp>(op)([&result](boost::system::error_code ec, auto&&...){result = ec;});

	m_ioc.restart();
	m_ioc.run();
	return result;
}

nlohmann::json HTTPSession::post(const nlohmann::json& command, std::chrono::milliseconds timeout, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto body = command.dump();

	// The device may have dropped an idle keep-alive connection. In that case
	// try once more with a fresh one before reporting the error.
	auto reused = m_stream.socket().is_open();
	auto result = round_trip(body, timeout, ec);
	if (ec == Error::device_unreachable && reused)
	{
		Log(LOG_DEBUG, "keep-alive connection to %1% lost, reconnecting", m_remote);
		disconnect();
		result = round_trip(body, timeout, ec);
	}

	if (ec && ec != Error::bad_response)
		disconnect();

	return result;
}

nlohmann::json HTTPSession::round_trip(const std::string& body, std::chrono::milliseconds timeout, std::error_code& ec)
{
	if (!m_stream.socket().is_open())
	{
		m_stream.expires_after(timeout);
		if (auto bec = run([this](auto&& handler){m_stream.async_connect(m_remote, std::forward<decltype(handler)>(handler));}); bec)
		{
			ec = classify(bec);
			return {};
		}
	}

	http::request<http::string_body> req{http::verb::post, m_target, 11};
	req.set(http::field::host, m_remote.address().to_string());
	req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
	req.set(http::field::content_type, "application/json");
	req.keep_alive(true);
	req.body() = body;
	req.prepare_payload();

	m_stream.expires_after(timeout);
	if (auto bec = run([this, &req](auto&& handler){http::async_write(m_stream, req, std::forward<decltype(handler)>(handler));}); bec)
	{
		ec = classify(bec);
		return {};
	}

	http::response<http::string_body> res;
	if (auto bec = run([this, &res](auto&& handler){http::async_read(m_stream, m_buffer, res, std::forward<decltype(handler)>(handler));}); bec)
	{
		ec = classify(bec);
		return {};
	}
	m_stream.expires_never();

	if (!res.keep_alive())
		disconnect();

	if (res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "device %1% returned HTTP %2%", m_remote, res.result_int());
		ec = Error::bad_response;
		return {};
	}

	auto json = nlohmann::json::parse(res.body(), nullptr, false);
	if (json.is_discarded())
	{
		Log(LOG_WARNING, "device %1% returned non-JSON response", m_remote);
		ec = Error::bad_response;
		return {};
	}

	ec.clear();
	return json;
}

void HTTPSession::disconnect()
{
	if (!m_stream.socket().is_open())
		return;

	boost::system::error_code ec;
	m_stream.socket().shutdown(tcp::socket::shutdown_both, ec);
	if (ec && ec != boost::asio::error::not_connected)
		Log(LOG_DEBUG, "shutdown connection to %1%: %2%", m_remote, ec.message());

	m_stream.close();
	m_buffer.clear();
}

HTTPTransport::HTTPTransport(const DeviceSetting& cfg) : m_cfg{cfg}
{
}

std::shared_ptr<DeviceSession> HTTPTransport::open(const std::string& ip)
{
	boost::system::error_code ec;
	auto addr = boost::asio::ip::make_address_v4(ip, ec);
	if (ec)
		return {};

	return std::make_shared<HTTPSession>(tcp::endpoint{addr, m_cfg.port}, m_cfg.path);
}

} // end of namespace pxr
