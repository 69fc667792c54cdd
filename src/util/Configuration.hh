/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#pragma once

#include "Exception.hh"
#include "FS.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pxr {

using namespace std::chrono_literals;

/// Physical limits of the display
struct DeviceSetting
{
	int width{64};
	int height{64};
	std::size_t max_frames{40};
	int min_speed_ms{50};

	unsigned short port{80};
	std::string path{"/post"};
};

struct ConnectionSetting
{
	int max_retries{3};
	std::chrono::milliseconds command_timeout{120s};
	std::chrono::milliseconds connect_timeout{10s};

	// wait backoff, 2*backoff, 4*backoff... between attempts
	std::chrono::milliseconds backoff{1s};
};

struct DiscoverySetting
{
	std::chrono::milliseconds timeout{3s};
	std::chrono::milliseconds last_ip_timeout{500ms};
	std::chrono::milliseconds probe_timeout{300ms};
	std::size_t workers{50};
	std::string service_type{"_pixoo._tcp.local."};
};

struct RotationSetting
{
	std::vector<int> intervals{60, 120, 300};
	std::chrono::milliseconds reconnect_poll{5s};
	std::chrono::milliseconds error_pause{5s};
	int max_failures{3};
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct ValueError : virtual Error {};

public:
	Configuration();
	Configuration(int argc, const char *const *argv, const char *env);

	const fs::path& data_dir() const {return m_data_dir;}
	const fs::path& temp_dir() const {return m_temp_dir;}
	const fs::path& gallery_dir() const {return m_gallery_dir;}
	fs::path last_connection_file() const {return m_data_dir / "last_connection.json";}
	fs::path rotation_config_file() const {return m_data_dir / "rotation_config.json";}

	const DeviceSetting& device() const {return m_device;}
	const ConnectionSetting& connection() const {return m_connection;}
	const DiscoverySetting& discovery() const {return m_discovery;}
	const RotationSetting& rotation() const {return m_rotation;}
	std::chrono::seconds upload_ttl() const {return m_upload_ttl;}
	std::size_t thread_count() const {return m_thread_count;}
	int log_level() const {return m_log_level;}

	bool help() const {return m_args.count("help") > 0;}
	bool discover() const {return m_args.count("discover") > 0;}
	bool clear() const {return m_args.count("clear") > 0;}
	bool resume() const {return m_args.count("resume") > 0;}
	bool forget_rotation() const {return m_args.count("forget-rotation") > 0;}

	template <typename Function>
	bool connect_to(Function&& func) const
	{
		return m_args.count("connect") > 0 ?
			(func(m_args["connect"].as<std::string>()), true) :
			false;
	}

	template <typename Function>
	bool upload(Function&& func) const
	{
		return m_args.count("upload") > 0 ?
			(func(fs::path{m_args["upload"].as<std::string>()}, speed()), true) :
			false;
	}

	template <typename Function>
	bool rotate(Function&& func) const
	{
		return m_args.count("rotate") > 0 ?
			(func(selected_ids(), m_args["interval"].as<int>()), true) :
			false;
	}

	void usage(std::ostream& out) const;

	// for unit tests
	void data_dir(fs::path path);
	void gallery_dir(fs::path path) {m_gallery_dir = std::move(path);}
	void rotation(const RotationSetting& setting) {m_rotation = setting;}
	void connection(const ConnectionSetting& setting) {m_connection = setting;}

private:
	void load_config(const fs::path& path);
	std::optional<int> speed() const;
	std::vector<std::string> selected_ids() const;

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	fs::path m_data_dir, m_temp_dir, m_gallery_dir;

	DeviceSetting       m_device;
	ConnectionSetting   m_connection;
	DiscoverySetting    m_discovery;
	RotationSetting     m_rotation;

	std::chrono::seconds m_upload_ttl{3600};
	std::size_t m_thread_count{2};
	int m_log_level;
};

} // end of namespace
