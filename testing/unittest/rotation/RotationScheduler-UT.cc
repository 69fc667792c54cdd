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

#include "common/MockDevice.hh"

#include "device/DeviceConnection.hh"
#include "device/FrameUploader.hh"
#include "rotation/RotationConfig.hh"
#include "rotation/RotationScheduler.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"

#include <algorithm>
#include <functional>
#include <thread>

using namespace pxr;
using namespace std::chrono_literals;

namespace {

struct Fixture
{
	Fixture()
	{
		fs::create_directories(store_file.parent_path());
		fs::remove(store_file);

		connection.backoff = 1ms;
		rotation.reconnect_poll = 10ms;
		rotation.error_pause = 10ms;

		transport.reply("10.0.0.5", MockTransport::Reply::success);
		std::error_code ec;
		device.connect("10.0.0.5", ec);
		REQUIRE(!ec);

		for (auto id : {"a1", "b2", "c3"})
			gallery.add(id, fs::path{"/gallery/gifs"} / (std::string{id} + ".gif"));
	}

	~Fixture()
	{
		fs::remove(store_file);
	}

	cv::Animation load(const fs::path& path, std::error_code& ec)
	{
		if (on_load)
			on_load();

		std::unique_lock lock{mutex};
		shown.push_back(path.stem().string());
		ec.clear();
		return solid_animation(2, 64, 64, 100);
	}

	std::vector<std::string> shown_items()
	{
		std::unique_lock lock{mutex};
		return shown;
	}

	fs::path store_file{fs::temp_directory_path() / "pxr-rotation-UT" / "rotation_config.json"};

	boost::asio::io_context     ioc;
	boost::asio::thread_pool    pool{1};

	MockTransport       transport;
	ConnectionSetting   connection;
	DeviceSetting       display;
	RotationSetting     rotation;
	DeviceConnection    device{transport, connection};
	FrameUploader       uploader{device, display, [this](auto&& path, auto& ec){return load(path, ec);}};
	MockGallery         gallery;
	RotationStore       store{store_file};

	std::mutex                  mutex;
	std::vector<std::string>    shown;
	std::function<void()>       on_load;
};

struct SchedulerFixture : Fixture
{
	RotationScheduler subject{ioc, pool, device, uploader, gallery, store, rotation};
};

}

TEST_CASE_METHOD(SchedulerFixture, "start validates its arguments", "[error]")
{
	REQUIRE(subject.start({"a1"}, 45) == Error::invalid_interval);
	REQUIRE(subject.start({"a1"}, 45) == ErrorKind::validation);
	REQUIRE(subject.start({}, 60) == Error::empty_selection);
	REQUIRE(subject.start({"x", "y"}, 60) == Error::unknown_item);

	REQUIRE_FALSE(subject.status().is_active);
	REQUIRE_FALSE(store.exists());
}

TEST_CASE_METHOD(SchedulerFixture, "start filters unknown items and saves the config", "[normal]")
{
	REQUIRE(!subject.start({"a1", "x", "b2", "a1"}, 60));

	auto status = subject.status();
	REQUIRE(status.is_active);
	REQUIRE_FALSE(status.is_paused);
	REQUIRE(status.selected_ids == std::vector<std::string>{"a1", "b2"});
	REQUIRE(status.interval_seconds == 60);
	REQUIRE(status.interval_label == "1 minute");
	REQUIRE(status.current_index == 0);
	REQUIRE(subject.running());

	std::error_code ec;
	auto saved = store.load(ec);
	REQUIRE(saved.has_value());
	REQUIRE(saved->selected_ids == std::vector<std::string>{"a1", "b2"});
	REQUIRE(saved->interval_seconds == 60);
}

TEST_CASE_METHOD(SchedulerFixture, "removing every item stops the rotation", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 60));
	REQUIRE(!subject.remove_item("a1"));
	REQUIRE(subject.status().is_active);
	REQUIRE(!subject.remove_item("b2"));

	auto status = subject.status();
	REQUIRE_FALSE(status.is_active);
	REQUIRE_FALSE(status.has_saved_config);
	REQUIRE_FALSE(store.exists());
	REQUIRE_FALSE(subject.running());
}

TEST_CASE_METHOD(SchedulerFixture, "add and remove items", "[normal]")
{
	REQUIRE(subject.add_item("a1") == Error::rotation_inactive);
	REQUIRE(subject.remove_item("a1") == Error::rotation_inactive);

	REQUIRE(!subject.start({"a1"}, 120));
	REQUIRE(subject.add_item("zz") == Error::unknown_item);
	REQUIRE(subject.remove_item("b2") == Error::unknown_item);

	REQUIRE(!subject.add_item("b2"));
	REQUIRE(!subject.add_item("b2"));
	REQUIRE(subject.status().selected_ids == std::vector<std::string>{"a1", "b2"});

	std::error_code ec;
	REQUIRE(store.load(ec)->selected_ids == std::vector<std::string>{"a1", "b2"});
}

TEST_CASE_METHOD(SchedulerFixture, "each round shows every item once", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2", "c3"}, 300));

	for (int i = 0; i < 6; ++i)
		REQUIRE(subject.run_once() == std::chrono::milliseconds{300s});

	auto shown = shown_items();
	REQUIRE(shown.size() == 6);
	for (auto round : {shown.begin(), shown.begin() + 3})
	{
		std::vector<std::string> items{round, round + 3};
		std::sort(items.begin(), items.end());
		REQUIRE(items == std::vector<std::string>{"a1", "b2", "c3"});
	}

	// one reset and two frames per item
	REQUIRE(transport.post_count() == 1 + 6 * 3);
}

TEST_CASE_METHOD(SchedulerFixture, "removing a shown item keeps the position", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2", "c3"}, 60));
	REQUIRE(subject.run_once());
	REQUIRE(subject.run_once());
	REQUIRE(subject.status().current_index == 2);

	auto shown = shown_items();
	REQUIRE(!subject.remove_item(shown.front()));
	REQUIRE(subject.status().current_index == 1);

	// the item not shown yet is still next
	std::vector<std::string> all{"a1", "b2", "c3"};
	auto next = *std::find_if(all.begin(), all.end(), [&shown](auto& id)
	{
		return std::find(shown.begin(), shown.end(), id) == shown.end();
	});
	REQUIRE(subject.run_once());
	REQUIRE(shown_items().back() == next);
}

TEST_CASE_METHOD(SchedulerFixture, "rotation pauses while disconnected", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 60));

	device.disconnect();
	REQUIRE(subject.run_once() == rotation.reconnect_poll);
	REQUIRE(subject.status().is_paused);
	REQUIRE(subject.status().current_index == 0);
	REQUIRE(shown_items().empty());

	std::error_code ec;
	device.connect("10.0.0.5", ec);
	REQUIRE(!ec);
	REQUIRE(subject.run_once() == std::chrono::milliseconds{60s});
	REQUIRE_FALSE(subject.status().is_paused);
	REQUIRE(shown_items().size() == 1);
}

TEST_CASE_METHOD(SchedulerFixture, "items that vanished from the gallery are dropped", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 60));
	gallery.erase("a1");
	gallery.erase("b2");

	REQUIRE(subject.run_once() == std::chrono::milliseconds{0});
	REQUIRE(subject.run_once() == std::chrono::milliseconds{0});
	REQUIRE_FALSE(subject.status().is_active);
	REQUIRE_FALSE(subject.run_once().has_value());
	REQUIRE(shown_items().empty());
}

TEST_CASE_METHOD(SchedulerFixture, "upload failures do not stop the rotation", "[error]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 60));
	transport.reply("10.0.0.5", MockTransport::Reply::rejected);

	for (int i = 0; i < 5; ++i)
		REQUIRE(subject.run_once() == std::chrono::milliseconds{60s});

	REQUIRE(subject.status().is_active);
	REQUIRE(shown_items().size() == 5);
}

TEST_CASE_METHOD(SchedulerFixture, "failure of a stopped rotation is not counted", "[error]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 60));
	transport.reply("10.0.0.5", MockTransport::Reply::rejected);

	REQUIRE(subject.run_once() == std::chrono::milliseconds{60s});
	REQUIRE(subject.consecutive_failures() == 1);

	// stopped while the upload is in progress
	on_load = [this]{REQUIRE(!subject.stop());};
	REQUIRE_FALSE(subject.run_once().has_value());
	on_load = nullptr;

	REQUIRE(subject.consecutive_failures() == 1);
	REQUIRE(subject.status().current_index == 1);

	// a new rotation starts from a clean slate
	REQUIRE(!subject.resume());
	REQUIRE(subject.consecutive_failures() == 0);
	REQUIRE(subject.run_once() == std::chrono::milliseconds{60s});
	REQUIRE(subject.consecutive_failures() == 1);
}

TEST_CASE_METHOD(Fixture, "resume after restart", "[normal]")
{
	{
		RotationScheduler before{ioc, pool, device, uploader, gallery, store, rotation};
		REQUIRE(before.resume() == Error::no_saved_config);
		REQUIRE(!before.start({"a1", "b2", "c3"}, 120));
		REQUIRE(!before.stop());
		REQUIRE(before.stop() == Error::rotation_inactive);

		auto status = before.status();
		REQUIRE_FALSE(status.is_active);
		REQUIRE(status.has_saved_config);
		REQUIRE(status.selected_ids == std::vector<std::string>{"a1", "b2", "c3"});
	}

	gallery.erase("b2");

	RotationScheduler after{ioc, pool, device, uploader, gallery, store, rotation};
	REQUIRE(!after.resume());

	auto status = after.status();
	REQUIRE(status.is_active);
	REQUIRE(status.selected_ids == std::vector<std::string>{"a1", "c3"});
	REQUIRE(status.interval_seconds == 120);
	REQUIRE(status.interval_label == "2 minutes");
}

TEST_CASE_METHOD(Fixture, "resume fails when no saved item survives", "[error]")
{
	RotationScheduler subject{ioc, pool, device, uploader, gallery, store, rotation};
	REQUIRE(!subject.start({"a1"}, 60));
	REQUIRE(!subject.stop());

	gallery.erase("a1");
	REQUIRE(subject.resume() == Error::empty_selection);
	REQUIRE_FALSE(subject.status().is_active);

	REQUIRE(!subject.delete_saved_config());
	REQUIRE(subject.delete_saved_config() == Error::no_saved_config);
	REQUIRE(subject.resume() == Error::no_saved_config);
}

TEST_CASE_METHOD(SchedulerFixture, "interval options", "[normal]")
{
	auto options = subject.intervals();
	REQUIRE(options.size() == 3);
	REQUIRE(options[0].seconds == 60);
	REQUIRE(options[0].label == "1 minute");
	REQUIRE(options[2].label == "5 minutes");
	REQUIRE(RotationScheduler::interval_label(90) == "90 seconds");
}

TEST_CASE_METHOD(SchedulerFixture, "stop cancels the waiting rotation task", "[normal]")
{
	REQUIRE(!subject.start({"a1", "b2"}, 300));
	std::thread loop{[this]{ioc.run();}};

	// the first item is shown right away
	auto deadline = std::chrono::steady_clock::now() + 10s;
	while (shown_items().empty() && std::chrono::steady_clock::now() < deadline)
		std::this_thread::sleep_for(10ms);
	REQUIRE(shown_items().size() == 1);

	// io_context::run() returns only after the 5 minute wait is cancelled
	REQUIRE(!subject.stop());
	loop.join();

	REQUIRE_FALSE(subject.running());
	REQUIRE(shown_items().size() == 1);
}
