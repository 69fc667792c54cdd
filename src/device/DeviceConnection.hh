/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/11/18.
//

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace pxr {

class DeviceSession;
class DeviceTransport;
class LastDevice;
struct ConnectionSetting;

struct ConnectionStatus
{
	bool        connected{false};
	std::string ip;     // empty if not connected
};

void to_json(nlohmann::json& json, const ConnectionStatus& status);

/// \brief  The one link between this process and the display.
///
/// Construct one instance at start-up and pass it by reference to every
/// component that talks to the device. The mutex protects the fields only:
/// it is never held while waiting for the network, so status queries are
/// not blocked by a slow command.
class DeviceConnection
{
public:
	enum class State {disconnected, connecting, connected};

public:
	DeviceConnection(DeviceTransport& transport, const ConnectionSetting& cfg, LastDevice *last = nullptr);
	DeviceConnection(const DeviceConnection&) = delete;
	DeviceConnection& operator=(const DeviceConnection&) = delete;
	~DeviceConnection();

	/// Performs the handshake. On failure the previous state is kept and
	/// \a ec tells a timeout (Error::device_timeout) from a refusal
	/// (Error::device_unreachable) or a rejected handshake.
	void connect(const std::string& ip, std::error_code& ec);
	void disconnect();

	/// Send a command with the configured number of retries and timeout.
	nlohmann::json send_command(const nlohmann::json& command, std::error_code& ec);

	/// \brief  Send a command to the connected device.
	///
	/// Every attempt that fails at the transport level is retried, up to
	/// \a max_retries attempts in total, with exponential backoff between
	/// them. A timeout never changes the state. If the last attempt failed
	/// because the device refused or dropped the connection, the session is
	/// torn down before the error is returned. A response with a non-zero
	/// status fails with Error::command_failed and is not retried.
	nlohmann::json send_command(
		const nlohmann::json& command,
		int max_retries,
		std::chrono::milliseconds timeout,
		std::error_code& ec
	);

	/// backoff, 2*backoff, 4*backoff... before the retry after \a attempt
	/// (zero-based). The doubling stops after 10 attempts.
	static std::chrono::milliseconds backoff_delay(std::chrono::milliseconds backoff, int attempt);

	ConnectionStatus status() const;
	State state() const;
	bool is_connected() const;
	std::string current_ip() const;

private:
	DeviceTransport&            m_transport;
	const ConnectionSetting&    m_cfg;
	LastDevice                  *m_last{};

	mutable std::mutex m_mutex;
	State                           m_state{State::disconnected};
	std::string                     m_ip;
	std::shared_ptr<DeviceSession>  m_session;
};

} // end of namespace pxr
