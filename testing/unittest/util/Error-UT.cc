/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 3/9/18.
//

#include <catch2/catch.hpp>

#include "util/Error.hh"

using namespace pxr;

TEST_CASE("every error belongs to one kind", "[normal]")
{
	std::error_code ec = Error::device_timeout;
	REQUIRE(ec == ErrorKind::connection);
	REQUIRE(ec != ErrorKind::upload);
	REQUIRE(std::string{ec.category().name()} == "pxr");

	REQUIRE(std::error_code{Error::device_unreachable} == ErrorKind::connection);
	REQUIRE(std::error_code{Error::not_connected} == ErrorKind::connection);
	REQUIRE(std::error_code{Error::handshake_rejected} == ErrorKind::connection);
	REQUIRE(std::error_code{Error::too_many_frames} == ErrorKind::too_many_frames);
	REQUIRE(std::error_code{Error::upload_failed} == ErrorKind::upload);
	REQUIRE(std::error_code{Error::command_failed} == ErrorKind::upload);
	REQUIRE(std::error_code{Error::invalid_ip} == ErrorKind::validation);
	REQUIRE(std::error_code{Error::invalid_interval} == ErrorKind::validation);
	REQUIRE(std::error_code{Error::unknown_item} == ErrorKind::validation);
	REQUIRE(std::error_code{Error::rotation_inactive} == ErrorKind::validation);
}

TEST_CASE("error messages", "[normal]")
{
	REQUIRE(std::error_code{Error::too_many_frames}.message() == "too many frames");
	REQUIRE_FALSE(make_error_condition(ErrorKind::connection).message().empty());
}

TEST_CASE("system errors are not pxr kinds", "[normal]")
{
	auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
	REQUIRE(ec != ErrorKind::connection);
	REQUIRE(ec != ErrorKind::validation);
}
