/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 9/1/2020.
//

#include "MDNSBrowser.hh"

#include "util/Log.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/endian/conversion.hpp>

#include <array>
#include <cstring>
#include <functional>
#include <set>

namespace pxr {

namespace {

using udp = boost::asio::ip::udp;

const udp::endpoint mdns_group{boost::asio::ip::make_address_v4("224.0.0.251"), 5353};

const std::uint16_t type_a   = 1;
const std::uint16_t type_ptr = 12;
const std::uint16_t class_in = 1;

std::uint16_t read_u16(const std::uint8_t *p)
{
	std::uint16_t v;
	std::memcpy(&v, p, sizeof(v));
	return boost::endian::big_to_native(v);
}

void write_u16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
	out.push_back(static_cast<std::uint8_t>(v >> 8));
	out.push_back(static_cast<std::uint8_t>(v & 0xff));
}

// Returns the offset just past the (possibly compressed) name at "offset",
// or 0 if the name runs past the end of the message.
std::size_t skip_name(const std::uint8_t *msg, std::size_t size, std::size_t offset)
{
	while (offset < size)
	{
		auto len = msg[offset];
		if (len == 0)
			return offset + 1;
		if ((len & 0xC0) == 0xC0)
			return offset + 2 <= size ? offset + 2 : 0;
		offset += 1 + len;
	}
	return 0;
}

} // end of local namespace

std::vector<std::uint8_t> MDNSBrowser::make_query(std::string_view service)
{
	std::vector<std::uint8_t> query;

	// header: ID, flags, QDCOUNT=1, ANCOUNT, NSCOUNT, ARCOUNT
	for (auto field : {0, 0, 1, 0, 0, 0})
		write_u16(query, static_cast<std::uint16_t>(field));

	while (!service.empty())
	{
		auto dot   = service.find('.');
		auto label = service.substr(0, dot);
		if (!label.empty() && label.size() < 64)
		{
			query.push_back(static_cast<std::uint8_t>(label.size()));
			query.insert(query.end(), label.begin(), label.end());
		}
		service.remove_prefix(dot == service.npos ? service.size() : dot + 1);
	}
	query.push_back(0);

	write_u16(query, type_ptr);
	write_u16(query, class_in);
	return query;
}

std::vector<boost::asio::ip::address_v4> MDNSBrowser::parse_response(const std::uint8_t *msg, std::size_t size)
{
	std::vector<boost::asio::ip::address_v4> result;
	if (size < 12)
		return result;

	auto qdcount = read_u16(msg + 4);
	auto rrcount = read_u16(msg + 6) + read_u16(msg + 8) + read_u16(msg + 10);

	std::size_t offset = 12;
	for (auto i = 0U; i < qdcount; ++i)
	{
		offset = skip_name(msg, size, offset);
		if (offset == 0 || offset + 4 > size)
			return result;
		offset += 4;
	}

	for (auto i = 0; i < rrcount; ++i)
	{
		offset = skip_name(msg, size, offset);
		if (offset == 0 || offset + 10 > size)
			break;

		auto type   = read_u16(msg + offset);
		auto rdlen  = read_u16(msg + offset + 8);
		offset += 10;
		if (offset + rdlen > size)
			break;

		if (type == type_a && rdlen == 4)
		{
			boost::asio::ip::address_v4::bytes_type bytes;
			std::memcpy(bytes.data(), msg + offset, bytes.size());
			result.emplace_back(bytes);
		}
		offset += rdlen;
	}
	return result;
}

std::vector<std::string> MDNSBrowser::browse(std::string_view service, std::chrono::milliseconds timeout, std::error_code& ec)
{
	boost::asio::io_context ioc;
	udp::socket socket{ioc};

	boost::system::error_code bec;
	socket.open(udp::v4(), bec);
	if (!bec)
		socket.set_option(boost::asio::ip::multicast::hops(255), bec);
	if (!bec)
		socket.send_to(boost::asio::buffer(make_query(service)), mdns_group, 0, bec);
	if (bec)
	{
		Log(LOG_NOTICE, "cannot send mDNS query for %1%: %2%", service, bec.message());
		ec = static_cast<std::error_code>(bec);
		return {};
	}

	std::set<std::string> found;
	std::array<std::uint8_t, 9000> buf{};
	udp::endpoint sender;

	std::function<void()> receive = [&]
	{
		socket.async_receive_from(boost::asio::buffer(buf), sender, [&](boost::system::error_code err, std::size_t count)
		{
			if (err)
				return;

			for (auto&& addr : parse_response(buf.data(), count))
				if (found.insert(addr.to_string()).second)
					Log(LOG_DEBUG, "mDNS: %1% answered from %2%", addr, sender);
			receive();
		});
	};

	boost::asio::steady_timer timer{ioc, timeout};
	timer.async_wait([&socket](boost::system::error_code)
	{
		boost::system::error_code ignore;
		socket.close(ignore);
	});

	receive();
	ioc.run();

	ec.clear();
	return {found.begin(), found.end()};
}

} // end of namespace pxr
