/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 6/25/18.
//

#pragma once

#include "device/DeviceTransport.hh"
#include "device/ServiceBrowser.hh"
#include "rotation/Gallery.hh"

#include <opencv2/imgcodecs.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pxr {

/// In-process stand-in for the display. Each IP address is scripted to
/// answer successfully, reject the command, time out or refuse the
/// connection. Addresses that are not scripted refuse.
class MockTransport : public DeviceTransport
{
public:
	enum class Reply {success, rejected, timeout, refused};

	/// Replaces the scripted replies for every address.
	using Handler = std::function<nlohmann::json(const std::string& ip, const nlohmann::json& command, std::error_code& ec)>;

public:
	void reply(const std::string& ip, Reply r);
	void handler(Handler h);

	std::shared_ptr<DeviceSession> open(const std::string& ip) override;

	nlohmann::json post(const std::string& ip, const nlohmann::json& command, std::error_code& ec);

	std::size_t post_count() const;
	std::vector<std::string> posted_to() const;
	std::vector<nlohmann::json> commands() const;
	std::vector<std::string> command_names() const;

private:
	mutable std::mutex m_mutex;
	std::map<std::string, Reply> m_replies;
	Handler m_handler;
	std::vector<std::pair<std::string, nlohmann::json>> m_log;
};

class MockBrowser : public ServiceBrowser
{
public:
	explicit MockBrowser(std::vector<std::string> found = {}) : m_found{std::move(found)} {}

	std::vector<std::string> browse(std::string_view service, std::chrono::milliseconds timeout, std::error_code& ec) override;

	std::size_t calls() const {return m_calls;}

private:
	std::vector<std::string> m_found;
	std::size_t m_calls{};
};

class MockGallery : public Gallery
{
public:
	void add(const std::string& id, fs::path path = "/dev/null");
	void erase(const std::string& id);

	bool exists(const std::string& id) const override;
	std::optional<fs::path> path(const std::string& id) const override;

private:
	mutable std::mutex m_mutex;
	std::map<std::string, fs::path> m_items;
};

/// An animation of \a count BGR frames of the given size, every frame shown
/// for \a duration_ms.
cv::Animation solid_animation(std::size_t count, int width, int height, int duration_ms);

} // end of namespace pxr
