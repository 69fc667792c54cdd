/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/22/18.
//

#include <catch2/catch.hpp>

#include "util/Base64.hh"

using namespace pxr;

TEST_CASE("base64 encode with padding", "[normal]")
{
	std::string_view in{"any carnal pleasure."};
	REQUIRE(base64_encode(in.data(), in.size()) == "YW55IGNhcm5hbCBwbGVhc3VyZS4=");
	REQUIRE(base64_encode(in.data(), in.size() - 1) == "YW55IGNhcm5hbCBwbGVhc3VyZQ==");
	REQUIRE(base64_encode(in.data(), in.size() - 2) == "YW55IGNhcm5hbCBwbGVhc3Vy");
	REQUIRE(base64_encode(in.data(), 0) == "");
}

TEST_CASE("base64 decode", "[normal]")
{
	auto out = base64_decode("YW55IGNhcm5hbCBwbGVhc3VyZQ==");
	REQUIRE(out.has_value());
	REQUIRE(std::string(out->begin(), out->end()) == "any carnal pleasure");

	std::vector<std::uint8_t> rgb(64*64*3, 0xff);
	auto decoded = base64_decode(base64_encode(rgb));
	REQUIRE(decoded.has_value());
	REQUIRE(decoded->size() == rgb.size());
}

TEST_CASE("base64 decode rejects garbage", "[error]")
{
	REQUIRE_FALSE(base64_decode("not*base64!").has_value());
}
