/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 6/3/18.
//

#include <catch2/catch.hpp>

#include "device/HTTPTransport.hh"
#include "device/Protocol.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <thread>

using namespace pxr;
using namespace std::chrono_literals;

namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// A display on the loopback interface that serves one connection at a time.
// The "Command" field picks the behaviour:
//  slow:    answer after 500ms, then hang up
//  http500: answer with HTTP 500
//  text:    answer with a body that is not JSON
//  close:   answer, then hang up without saying so
// Everything else gets {"error_code": 0} on a kept-alive connection.
class LoopbackDevice
{
public:
	LoopbackDevice() :
		m_acceptor{m_ioc, tcp::endpoint{boost::asio::ip::make_address_v4("127.0.0.1"), 0}},
		m_endpoint{m_acceptor.local_endpoint()}
	{
		m_thread = std::thread{[this]{serve();}};
	}

	~LoopbackDevice()
	{
		// wake up accept()
		m_stop = true;
		boost::system::error_code ec;
		tcp::socket wake{m_ioc};
		wake.connect(m_endpoint, ec);
		m_thread.join();
	}

	unsigned short port() const {return m_endpoint.port();}
	int connections() const {return m_connections;}

private:
	void serve()
	{
		while (!m_stop)
		{
			tcp::socket socket{m_ioc};
			boost::system::error_code ec;
			m_acceptor.accept(socket, ec);
			if (ec || m_stop)
				break;

			++m_connections;
			serve(socket);
		}
	}

	void serve(tcp::socket& socket)
	{
		boost::beast::flat_buffer buffer;
		while (true)
		{
			boost::system::error_code ec;
			http::request<http::string_body> req;
			http::read(socket, buffer, req, ec);
			if (ec)
				return;

			auto command = nlohmann::json::parse(req.body(), nullptr, false);
			auto name = command.is_object() ? command.value("Command", "") : std::string{};

			http::response<http::string_body> res{http::status::ok, req.version()};
			res.set(http::field::content_type, "application/json");
			res.keep_alive(true);
			res.body() = R"({"error_code": 0})";

			if (name == "slow")
				std::this_thread::sleep_for(500ms);
			else if (name == "http500")
				res.result(http::status::internal_server_error);
			else if (name == "text")
			{
				res.set(http::field::content_type, "text/plain");
				res.body() = "hello";
			}

			res.prepare_payload();
			http::write(socket, res, ec);
			if (ec || name == "slow" || name == "close")
				return;
		}
	}

private:
	boost::asio::io_context m_ioc;
	tcp::acceptor           m_acceptor;
	tcp::endpoint           m_endpoint;
	std::atomic<bool>       m_stop{false};
	std::atomic<int>        m_connections{0};
	std::thread             m_thread;
};

nlohmann::json command(const std::string& name)
{
	return {{"Command", name}};
}

} // end of local namespace

TEST_CASE("open validates the address", "[normal]")
{
	DeviceSetting cfg;
	HTTPTransport subject{cfg};
	REQUIRE(subject.open("10.0.0.5"));
	REQUIRE_FALSE(subject.open("pixoo.local"));
	REQUIRE_FALSE(subject.open(""));
}

TEST_CASE("refused connection", "[error]")
{
	DeviceSetting cfg;
	cfg.port = 1;
	HTTPTransport subject{cfg};

	auto session = subject.open("127.0.0.1");
	REQUIRE(session);

	std::error_code ec;
	session->post(protocol::handshake(), std::chrono::seconds{2}, ec);
	REQUIRE(ec == Error::device_unreachable);
}

TEST_CASE("socket errors are classified", "[normal]")
{
	REQUIRE(!classify({}));
	REQUIRE(classify(boost::beast::error::timeout) == Error::device_timeout);
	REQUIRE(classify(boost::asio::error::timed_out) == Error::device_timeout);
	REQUIRE(classify(boost::asio::error::connection_refused) == Error::device_unreachable);
	REQUIRE(classify(boost::asio::error::connection_reset) == Error::device_unreachable);
	REQUIRE(classify(boost::asio::error::host_unreachable) == Error::device_unreachable);
}

TEST_CASE("commands share one kept-alive connection", "[normal]")
{
	LoopbackDevice device;
	DeviceSetting cfg;
	cfg.port = device.port();
	HTTPTransport subject{cfg};

	auto session = subject.open("127.0.0.1");
	REQUIRE(session);

	std::error_code ec;
	auto response = session->post(protocol::handshake(), 2s, ec);
	REQUIRE(!ec);
	REQUIRE(protocol::status(response) == 0);

	response = session->post(command("again"), 2s, ec);
	REQUIRE(!ec);
	REQUIRE(response == nlohmann::json{{"error_code", 0}});
	REQUIRE(device.connections() == 1);
}

TEST_CASE("reconnect once when the device hung up", "[normal]")
{
	LoopbackDevice device;
	DeviceSetting cfg;
	cfg.port = device.port();
	HTTPTransport subject{cfg};
	auto session = subject.open("127.0.0.1");

	std::error_code ec;
	session->post(command("close"), 2s, ec);
	REQUIRE(!ec);

	// the kept-alive connection is dead but the command still goes through
	auto response = session->post(protocol::handshake(), 2s, ec);
	REQUIRE(!ec);
	REQUIRE(protocol::status(response) == 0);
	REQUIRE(device.connections() == 2);
}

TEST_CASE("slow device times out", "[error]")
{
	LoopbackDevice device;
	DeviceSetting cfg;
	cfg.port = device.port();
	HTTPTransport subject{cfg};
	auto session = subject.open("127.0.0.1");

	std::error_code ec;
	session->post(command("slow"), 100ms, ec);
	REQUIRE(ec == Error::device_timeout);
	REQUIRE(ec == ErrorKind::connection);

	// a fresh connection is used afterwards
	session->post(protocol::handshake(), 2s, ec);
	REQUIRE(!ec);
	REQUIRE(device.connections() == 2);
}

TEST_CASE("HTTP errors and non-JSON bodies are bad responses", "[error]")
{
	LoopbackDevice device;
	DeviceSetting cfg;
	cfg.port = device.port();
	HTTPTransport subject{cfg};
	auto session = subject.open("127.0.0.1");

	std::error_code ec;
	session->post(command("http500"), 2s, ec);
	REQUIRE(ec == Error::bad_response);

	session->post(command("text"), 2s, ec);
	REQUIRE(ec == Error::bad_response);

	// the connection survives a bad response
	session->post(protocol::handshake(), 2s, ec);
	REQUIRE(!ec);
	REQUIRE(device.connections() == 1);
}
