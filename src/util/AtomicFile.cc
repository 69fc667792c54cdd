/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 3/3/18.
//

#include "AtomicFile.hh"

#include "Error.hh"
#include "Log.hh"

#include <cerrno>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace pxr {

namespace {

std::error_code last_error()
{
	return {errno, std::system_category()};
}

} // end of local namespace

void write_atomic(const fs::path& dest, std::string_view data, std::error_code& ec)
{
	auto parent = dest.parent_path();
	if (!parent.empty())
	{
		fs::create_directories(parent, ec);
		if (ec)
			return;
	}

	// mkstemps() needs a writable buffer
	auto tmpl = (parent / ("." + dest.filename().string() + ".XXXXXX.tmp")).string();
	std::vector<char> tmp_path{tmpl.begin(), tmpl.end()};
	tmp_path.push_back('\0');

	auto fd = ::mkstemps(tmp_path.data(), 4);
	if (fd < 0)
	{
		ec = last_error();
		return;
	}

	auto remaining = data;
	while (!remaining.empty())
	{
		auto written = ::write(fd, remaining.data(), remaining.size());
		if (written < 0)
		{
			if (errno == EINTR)
				continue;
			break;
		}
		remaining.remove_prefix(static_cast<std::size_t>(written));
	}

	if (!remaining.empty() || ::fsync(fd) != 0)
	{
		ec = last_error();
		::close(fd);
		::unlink(tmp_path.data());
		return;
	}

	if (::close(fd) != 0 || ::rename(tmp_path.data(), dest.c_str()) != 0)
	{
		ec = last_error();
		::unlink(tmp_path.data());
		return;
	}

	ec.clear();
}

void write_json_atomic(const fs::path& dest, const nlohmann::json& json, std::error_code& ec)
{
	write_atomic(dest, json.dump(2), ec);
	if (ec)
		Log(LOG_WARNING, "cannot write %1%: %2% (%3%)", dest, ec.message(), ec);
}

nlohmann::json read_json(const fs::path& src, std::error_code& ec)
{
	errno = 0;
	std::ifstream file{src};
	if (!file)
	{
		ec = errno != 0 ? last_error() : std::make_error_code(std::errc::io_error);
		return nlohmann::json::value_t::discarded;
	}

	auto json = nlohmann::json::parse(file, nullptr, false);
	if (json.is_discarded())
	{
		Log(LOG_WARNING, "%1% is not a valid JSON file", src);
		ec = Error::invalid_config;
	}
	else
		ec.clear();

	return json;
}

} // end of namespace pxr
