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

#include <chrono>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pxr {

/// Local network service discovery, e.g. mDNS/DNS-SD.
class ServiceBrowser
{
public:
	virtual ~ServiceBrowser() = default;

	/// Collect the IPv4 addresses of every instance of \a service that
	/// answers within \a timeout.
	virtual std::vector<std::string> browse(
		std::string_view service,
		std::chrono::milliseconds timeout,
		std::error_code& ec
	) = 0;
};

} // end of namespace pxr
