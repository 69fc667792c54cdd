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

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <system_error>

namespace pxr {

/// \brief  A reusable link to one device.
///
/// post() reports failures as:
///  - Error::device_timeout if the device did not answer in time,
///  - Error::device_unreachable if the connection was refused, reset or
///    could not be established,
///  - Error::bad_response if the device answered something that is not a
///    JSON document in an HTTP 200 response.
///
/// The link is released when the last reference to the session goes away.
class DeviceSession
{
public:
	virtual ~DeviceSession() = default;

	virtual nlohmann::json post(
		const nlohmann::json& command,
		std::chrono::milliseconds timeout,
		std::error_code& ec
	) = 0;
};

/// Creates sessions. The production implementation is HTTPTransport; unit
/// tests substitute a scripted one.
class DeviceTransport
{
public:
	virtual ~DeviceTransport() = default;

	/// Returns nullptr if \a ip is not a valid IPv4 address.
	virtual std::shared_ptr<DeviceSession> open(const std::string& ip) = 0;
};

} // end of namespace pxr
