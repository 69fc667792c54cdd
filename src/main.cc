/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

#include "Relay.hh"

#include "device/HTTPTransport.hh"

#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/asio/signal_set.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace pxr {

int report(std::error_code ec, std::string_view action)
{
	if (!ec)
		return EXIT_SUCCESS;

	Log(LOG_ERR, "%1% failed: %2%", action, ec.message());
	std::cerr << action << ": " << ec.message() << std::endl;
	return EXIT_FAILURE;
}

// Connect to the device given on the command line, or the first one discovered.
std::error_code connect(Relay& relay, const Configuration& cfg)
{
	std::error_code ec;
	if (cfg.connect_to([&relay, &ec](auto&& ip){relay.device().connect(ip, ec);}))
		return ec;

	auto found = relay.discovery().discover();
	if (found.empty())
		return Error::device_unreachable;

	relay.device().connect(found.front(), ec);
	return ec;
}

// Keep rotating until we are told to stop.
void run(Relay& relay)
{
	boost::asio::signal_set signals{relay.get_io_context(), SIGINT, SIGTERM};
	signals.async_wait([&relay](boost::system::error_code ec, int signal)
	{
		if (!ec)
		{
			Log(LOG_NOTICE, "signal %1% received, stopping", signal);
			relay.shutdown();
		}
	});

	relay.start_housekeeping();
	relay.get_io_context().run();
}

int StartRelay(const Configuration& cfg)
{
	HTTPTransport transport{cfg.device()};
	Relay relay{cfg, transport};
	Log(LOG_NOTICE, "pixoo_relay (version %1%) starting", constants::version);

	if (cfg.discover())
	{
		for (auto&& ip : relay.discovery().discover())
			std::cout << ip << "\n";
		return EXIT_SUCCESS;
	}

	if (cfg.forget_rotation())
		return report(relay.rotation().delete_saved_config(), "forget rotation");

	if (auto ec = connect(relay, cfg); ec)
		return report(ec, "connect");
	std::cout << nlohmann::json(relay.device().status()) << std::endl;

	std::error_code ec;
	if (cfg.clear())
	{
		relay.uploader().clear_display(ec);
		if (ec)
			return report(ec, "clear");
	}

	if (cfg.upload([&relay, &ec](const fs::path& path, std::optional<int> speed)
	{
		auto result = relay.uploader().upload_gif(path, speed, [](std::size_t frame, std::size_t total)
		{
			std::cout << "\rsending frame " << frame << "/" << total << std::flush;
		}, ec);
		std::cout << "\n" << result.frames_sent << " frame(s) sent at " << result.speed_ms << " ms per frame" << std::endl;
	})) {return report(ec, "upload");}

	auto rotating = cfg.rotate([&relay, &ec](auto&& ids, int interval)
	{
		ec = relay.rotation().start(ids, interval);
	});
	if (!rotating && cfg.resume())
	{
		ec = relay.rotation().resume();
		rotating = true;
	}

	if (ec)
		return report(ec, "rotation");

	if (rotating)
	{
		std::cout << nlohmann::json(relay.rotation().status()) << std::endl;
		run(relay);
	}
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace pxr;
	try
	{
		Configuration cfg{argc, argv, ::getenv("PIXOO_RELAY_CONFIG")};
		SetLogLevel(cfg.log_level());
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		return StartRelay(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
}
