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

#include "ServiceBrowser.hh"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <optional>

namespace pxr {

/// \brief  A one-shot multicast DNS browser.
///
/// Sends a single PTR question for the service type to 224.0.0.251:5353
/// from an ephemeral port. Responders answer such "legacy unicast" queries
/// directly to the sender, so the A records in their replies tell us the
/// device addresses.
class MDNSBrowser : public ServiceBrowser
{
public:
	MDNSBrowser() = default;

	std::vector<std::string> browse(
		std::string_view service,
		std::chrono::milliseconds timeout,
		std::error_code& ec
	) override;

	// exposed for unit tests
	static std::vector<std::uint8_t> make_query(std::string_view service);
	static std::vector<boost::asio::ip::address_v4> parse_response(const std::uint8_t *msg, std::size_t size);
};

} // end of namespace pxr
