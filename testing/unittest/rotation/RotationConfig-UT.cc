/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#include <catch2/catch.hpp>

#include "rotation/RotationConfig.hh"
#include "util/AtomicFile.hh"
#include "util/Error.hh"

using namespace pxr;

namespace {

fs::path store_file(const std::string& name)
{
	auto dir = fs::temp_directory_path() / "pxr-rotation-config-UT";
	fs::create_directories(dir);
	auto file = dir / (name + ".json");
	fs::remove(file);
	return file;
}

}

TEST_CASE("rotation config JSON", "[normal]")
{
	RotationConfig config{{"a1", "b2"}, 60, Timestamp{std::chrono::seconds{1'600'000'000}}};

	nlohmann::json json = config;
	REQUIRE(json["version"] == 1);
	REQUIRE(json["selected_ids"] == nlohmann::json::array({"a1", "b2"}));
	REQUIRE(json["interval_seconds"] == 60);
	REQUIRE(json["updated_at"] == "2020-09-13T12:26:40.000Z");

	auto copy = json.get<RotationConfig>();
	REQUIRE(copy.selected_ids == config.selected_ids);
	REQUIRE(copy.interval_seconds == 60);
	REQUIRE(copy.updated_at == config.updated_at);
}

TEST_CASE("save, load and remove rotation config", "[normal]")
{
	RotationStore subject{store_file("round-trip")};
	REQUIRE_FALSE(subject.exists());

	std::error_code ec;
	REQUIRE_FALSE(subject.load(ec).has_value());
	REQUIRE(!ec);

	subject.save(RotationConfig{{"x"}, 300, Timestamp::now()}, ec);
	REQUIRE(!ec);
	REQUIRE(subject.exists());

	auto loaded = subject.load(ec);
	REQUIRE(!ec);
	REQUIRE(loaded.has_value());
	REQUIRE(loaded->selected_ids == std::vector<std::string>{"x"});
	REQUIRE(loaded->interval_seconds == 300);

	subject.remove(ec);
	REQUIRE(!ec);
	REQUIRE_FALSE(subject.exists());

	// removing again is fine
	subject.remove(ec);
	REQUIRE(!ec);
}

TEST_CASE("rotation config of another version is ignored", "[error]")
{
	auto file = store_file("version");
	std::error_code ec;
	write_json_atomic(file, {{"version", 2}, {"selected_ids", {"a"}}, {"interval_seconds", 60}}, ec);
	REQUIRE(!ec);

	RotationStore subject{file};
	REQUIRE_FALSE(subject.load(ec).has_value());
	REQUIRE(!ec);
}

TEST_CASE("malformed rotation config", "[error]")
{
	auto file = store_file("malformed");
	std::error_code ec;
	write_json_atomic(file, {{"version", 1}, {"selected_ids", "a"}}, ec);
	REQUIRE(!ec);

	RotationStore subject{file};
	REQUIRE_FALSE(subject.load(ec).has_value());
	REQUIRE(ec == Error::invalid_config);
}
