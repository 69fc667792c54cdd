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

#include "util/AtomicFile.hh"
#include "util/Error.hh"

#include <fstream>

using namespace pxr;

namespace {

fs::path test_dir(const std::string& name)
{
	auto dir = fs::temp_directory_path() / ("pxr-atomic-" + name);
	fs::remove_all(dir);
	return dir;
}

}

TEST_CASE("write JSON atomically into a new directory", "[normal]")
{
	auto dir = test_dir("new");
	auto file = dir / "sub" / "state.json";

	std::error_code ec;
	write_json_atomic(file, {{"ip", "10.0.0.5"}}, ec);
	REQUIRE(!ec);
	REQUIRE(fs::exists(file));

	auto json = read_json(file, ec);
	REQUIRE(!ec);
	REQUIRE(json["ip"] == "10.0.0.5");

	// no temporary file left behind
	REQUIRE(std::distance(fs::directory_iterator{file.parent_path()}, fs::directory_iterator{}) == 1);
	fs::remove_all(dir);
}

TEST_CASE("overwrite keeps only the new content", "[normal]")
{
	auto dir = test_dir("overwrite");
	auto file = dir / "state.json";

	std::error_code ec;
	write_json_atomic(file, {{"n", 1}}, ec);
	write_json_atomic(file, {{"n", 2}}, ec);
	REQUIRE(!ec);
	REQUIRE(read_json(file, ec)["n"] == 2);
	fs::remove_all(dir);
}

TEST_CASE("read_json errors", "[error]")
{
	auto dir = test_dir("errors");
	std::error_code ec;

	auto missing = read_json(dir / "missing.json", ec);
	REQUIRE(ec);
	REQUIRE(missing.is_discarded());

	fs::create_directories(dir);
	std::ofstream{dir / "garbage.json"} << "{not json";
	auto garbage = read_json(dir / "garbage.json", ec);
	REQUIRE(ec == Error::invalid_config);
	REQUIRE(garbage.is_discarded());
	fs::remove_all(dir);
}
