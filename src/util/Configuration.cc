/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#include "Configuration.hh"

#include "Log.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace po = boost::program_options;

namespace pxr {
namespace {

using jptr = nlohmann::json::json_pointer;

// Durations in the configuration file are in (possibly fractional) seconds
// unless the key ends with "_ms".
std::chrono::milliseconds duration_value(const nlohmann::json& json, const std::string& ptr, std::chrono::milliseconds def)
{
	using namespace std::chrono;
	auto in_ms = ptr.size() > 3 && ptr.compare(ptr.size() - 3, 3, "_ms") == 0;

	auto value = json.value(jptr{ptr}, in_ms ? static_cast<double>(def.count()) : duration<double>{def}.count());
	return in_ms ?
		milliseconds{static_cast<milliseconds::rep>(value)} :
		duration_cast<milliseconds>(duration<double>{value});
}

fs::path resolve(const nlohmann::json& json, const std::string& ptr, const fs::path& base, const fs::path& def)
{
	if (auto it = json.find(ptr); it != json.end())
		return fs::weakly_canonical(fs::absolute(base / it->get<std::string>()));
	else
		return def;
}

fs::path home_dir()
{
	auto home = ::getenv("HOME");
	return home ? fs::path{home} : fs::current_path();
}

} // end of local namespace

Configuration::Configuration() :
	m_data_dir{home_dir() / ".pixoo_manager"},
	m_temp_dir{fs::temp_directory_path() / "pixoo_manager"},
	m_gallery_dir{m_data_dir / "gallery"},
	m_log_level{LOG_INFO}
{
}

Configuration::Configuration(int argc, const char *const *argv, const char *env) : Configuration{}
{
	m_desc.add_options()
		("help",      "produce help message")
		("verbose,v", "log debug messages")
		("discover",  "search for devices in the local network")
		("connect",   po::value<std::string>()->value_name("ip"), "connect to the device at the given IP address")
		("upload",    po::value<std::string>()->value_name("file"), "send an animated GIF or image to the device")
		("speed",     po::value<int>()->value_name("ms"), "frame duration for --upload. Default is the average of the file")
		("clear",     "clear the text layer of the display")
		("rotate",    po::value<std::string>()->value_name("id,id,..."), "rotate the given gallery items on the display")
		("interval",  po::value<int>()->default_value(120)->value_name("sec"), "rotation interval for --rotate")
		("resume",    "resume the last saved rotation")
		("forget-rotation", "delete the saved rotation")
		("cfg",       po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{pxr::constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable PIXOO_RELAY_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
	{
		fs::path cfg = m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() : std::string{env ? env : ""};

		// the built-in default configuration file is optional
		auto explicit_cfg = env || (m_args.count("cfg") > 0 && !m_args["cfg"].defaulted());
		if (explicit_cfg || fs::exists(cfg))
			load_config(cfg);

		if (m_args.count("verbose") > 0)
			m_log_level = LOG_DEBUG;
	}
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		auto base = path.parent_path();

		// Paths are relative to the configuration file
		m_data_dir      = resolve(json, "data_dir", base, m_data_dir);
		m_temp_dir      = resolve(json, "temp_dir", base, m_temp_dir);
		m_gallery_dir   = resolve(json, "gallery_dir", base, m_data_dir / "gallery");
		m_thread_count  = json.value(jptr{"/thread_count"}, m_thread_count);

		if (auto it = json.find("log_level"); it != json.end())
		{
			auto level = ParseLogLevel(it->get<std::string>());
			if (!level)
				BOOST_THROW_EXCEPTION(ValueError() << Message{"unknown log_level " + it->get<std::string>()});
			m_log_level = *level;
		}

		m_device.width          = json.value(jptr{"/device/width"},        m_device.width);
		m_device.height         = json.value(jptr{"/device/height"},       m_device.height);
		m_device.max_frames     = json.value(jptr{"/device/max_frames"},   m_device.max_frames);
		m_device.min_speed_ms   = json.value(jptr{"/device/min_speed_ms"}, m_device.min_speed_ms);
		m_device.port           = json.value(jptr{"/device/port"},         m_device.port);
		m_device.path           = json.value(jptr{"/device/path"},         m_device.path);
		if (m_device.width <= 0 || m_device.height <= 0 || m_device.max_frames == 0)
			BOOST_THROW_EXCEPTION(ValueError() << Message{"invalid device dimension"});

		m_connection.max_retries     = json.value(jptr{"/connection/max_retries"}, m_connection.max_retries);
		m_connection.command_timeout = duration_value(json, "/connection/command_timeout_sec", m_connection.command_timeout);
		m_connection.connect_timeout = duration_value(json, "/connection/connect_timeout_sec", m_connection.connect_timeout);
		m_connection.backoff         = duration_value(json, "/connection/backoff_ms", m_connection.backoff);
		if (m_connection.max_retries < 1)
			BOOST_THROW_EXCEPTION(ValueError() << Message{"connection/max_retries must be at least 1"});

		m_discovery.timeout         = duration_value(json, "/discovery/timeout_sec", m_discovery.timeout);
		m_discovery.last_ip_timeout = duration_value(json, "/discovery/last_ip_timeout_ms", m_discovery.last_ip_timeout);
		m_discovery.probe_timeout   = duration_value(json, "/discovery/probe_timeout_ms", m_discovery.probe_timeout);
		m_discovery.workers         = std::max<std::size_t>(1, json.value(jptr{"/discovery/workers"}, m_discovery.workers));
		m_discovery.service_type    = json.value(jptr{"/discovery/service_type"}, m_discovery.service_type);

		m_rotation.intervals      = json.value(jptr{"/rotation/intervals"}, m_rotation.intervals);
		m_rotation.reconnect_poll = duration_value(json, "/rotation/reconnect_poll_sec", m_rotation.reconnect_poll);
		m_rotation.error_pause    = duration_value(json, "/rotation/error_pause_sec", m_rotation.error_pause);
		m_rotation.max_failures   = json.value(jptr{"/rotation/max_failures"}, m_rotation.max_failures);
		if (m_rotation.intervals.empty() ||
			std::any_of(m_rotation.intervals.begin(), m_rotation.intervals.end(), [](int i){return i <= 0;}))
			BOOST_THROW_EXCEPTION(ValueError() << Message{"rotation/intervals must be positive"});

		m_upload_ttl = std::chrono::seconds{json.value(jptr{"/uploads/ttl_sec"}, m_upload_ttl.count())};
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

std::optional<int> Configuration::speed() const
{
	return m_args.count("speed") > 0 ? std::optional<int>{m_args["speed"].as<int>()} : std::nullopt;
}

std::vector<std::string> Configuration::selected_ids() const
{
	std::vector<std::string> ids;
	auto arg = m_args["rotate"].as<std::string>();
	boost::algorithm::split(ids, arg, boost::algorithm::is_any_of(","), boost::algorithm::token_compress_on);
	ids.erase(std::remove(ids.begin(), ids.end(), std::string{}), ids.end());
	return ids;
}

void Configuration::data_dir(fs::path path)
{
	m_data_dir = std::move(path);
	m_gallery_dir = m_data_dir / "gallery";
}

} // end of namespace
