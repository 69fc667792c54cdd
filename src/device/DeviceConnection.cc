/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/11/18.
//

#include "DeviceConnection.hh"

#include "DeviceTransport.hh"
#include "LastDevice.hh"
#include "Protocol.hh"

#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/ip/address_v4.hpp>

#include <algorithm>
#include <thread>

namespace pxr {

void to_json(nlohmann::json& json, const ConnectionStatus& status)
{
	json = nlohmann::json{
		{"connected", status.connected},
		{"ip", status.connected ? nlohmann::json(status.ip) : nlohmann::json(nullptr)}
	};
}

DeviceConnection::DeviceConnection(DeviceTransport& transport, const ConnectionSetting& cfg, LastDevice *last) :
	m_transport{transport}, m_cfg{cfg}, m_last{last}
{
}

DeviceConnection::~DeviceConnection() = default;

void DeviceConnection::connect(const std::string& ip, std::error_code& ec)
{
	boost::system::error_code bec;
	boost::asio::ip::make_address_v4(ip, bec);
	if (bec)
	{
		ec = Error::invalid_ip;
		return;
	}

	State previous;
	{
		std::unique_lock lock{m_mutex};
		previous = m_state;
		if (m_state == State::disconnected)
			m_state = State::connecting;
	}

	auto session = m_transport.open(ip);
	if (!session)
		ec = Error::invalid_ip;
	else
	{
		auto response = session->post(protocol::handshake(), m_cfg.connect_timeout, ec);
		if (!ec && protocol::status(response) != 0)
			ec = Error::handshake_rejected;
	}

	if (ec)
	{
		{
			std::unique_lock lock{m_mutex};
			if (m_state == State::connecting)
				m_state = previous;
		}
		Log(LOG_WARNING, "cannot connect to %1%: %2%", ip, ec.message());
		return;
	}

	// the old session (if any) is released outside the lock
	auto old = std::move(session);
	{
		std::unique_lock lock{m_mutex};
		m_session.swap(old);
		m_ip    = ip;
		m_state = State::connected;
	}
	old.reset();
	Log(LOG_NOTICE, "connected to device at %1%", ip);

	// failing to remember the IP only makes the next discovery slower
	if (m_last)
	{
		std::error_code save_ec;
		m_last->save(ip, save_ec);
		if (save_ec)
			Log(LOG_WARNING, "cannot save last device IP to %1%: %2%", m_last->path(), save_ec.message());
	}
}

void DeviceConnection::disconnect()
{
	std::shared_ptr<DeviceSession> session;
	std::string ip;
	{
		std::unique_lock lock{m_mutex};
		session.swap(m_session);
		ip.swap(m_ip);
		m_state = State::disconnected;
	}

	if (session)
		Log(LOG_NOTICE, "disconnected from %1%", ip);
}

nlohmann::json DeviceConnection::send_command(const nlohmann::json& command, std::error_code& ec)
{
	return send_command(command, m_cfg.max_retries, m_cfg.command_timeout, ec);
}

nlohmann::json DeviceConnection::send_command(
	const nlohmann::json& command,
	int max_retries,
	std::chrono::milliseconds timeout,
	std::error_code& ec
)
{
	std::string ip;
	std::shared_ptr<DeviceSession> session;
	{
		std::unique_lock lock{m_mutex};
		if (m_state != State::connected || !m_session)
		{
			ec = Error::not_connected;
			return {};
		}
		ip      = m_ip;
		session = m_session;
	}

	auto name = protocol::command_name(command);
	max_retries = std::max(1, max_retries);

	for (int attempt = 0; attempt < max_retries; ++attempt)
	{
		auto response = session->post(command, timeout, ec);
		if (!ec)
		{
			// a response without "error_code" is taken as success
			if (auto status = protocol::status(response); status.value_or(0) != 0)
			{
				Log(LOG_WARNING, "%1% failed on %2%: error_code %3%", name, ip, *status);
				ec = Error::command_failed;
			}
			return response;
		}

		// the device is there but talks nonsense: retrying won't help
		if (ec == Error::bad_response)
			return {};

		Log(LOG_WARNING, "%1% attempt %2%/%3% to %4% failed: %5%", name, attempt + 1, max_retries, ip, ec.message());
		if (attempt + 1 < max_retries)
		{
			auto wait = backoff_delay(m_cfg.backoff, attempt);
			Log(LOG_INFO, "retry %1% in %2% ms", name, wait.count());
			std::this_thread::sleep_for(wait);
		}
	}

	// Timeouts are transient and do not change the state. A refused or lost
	// connection after all retries means the device is gone.
	if (ec == Error::device_unreachable)
	{
		{
			std::unique_lock lock{m_mutex};
			if (m_session == session)
			{
				m_session.reset();
				m_ip.clear();
				m_state = State::disconnected;
			}
		}
		Log(LOG_WARNING, "connection to %1% lost after %2% attempts", ip, max_retries);
	}
	return {};
}

std::chrono::milliseconds DeviceConnection::backoff_delay(std::chrono::milliseconds backoff, int attempt)
{
	return backoff * (1 << std::clamp(attempt, 0, 10));
}

ConnectionStatus DeviceConnection::status() const
{
	std::unique_lock lock{m_mutex};
	auto connected = m_state == State::connected;
	return {connected, connected ? m_ip : std::string{}};
}

DeviceConnection::State DeviceConnection::state() const
{
	std::unique_lock lock{m_mutex};
	return m_state;
}

bool DeviceConnection::is_connected() const
{
	std::unique_lock lock{m_mutex};
	return m_state == State::connected;
}

std::string DeviceConnection::current_ip() const
{
	std::unique_lock lock{m_mutex};
	return m_state == State::connected ? m_ip : std::string{};
}

} // end of namespace pxr
