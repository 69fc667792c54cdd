/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace pxr {

class DeviceConnection;
class FrameUploader;
class Gallery;
class RotationStore;
struct RotationConfig;
struct RotationSetting;

struct RotationStatus
{
	bool is_active{false};
	bool is_paused{false};
	std::vector<std::string> selected_ids;
	int interval_seconds{};
	std::string interval_label;
	std::size_t current_index{};
	bool has_saved_config{false};
};

void to_json(nlohmann::json& json, const RotationStatus& status);

struct IntervalOption
{
	int         seconds;
	std::string label;
};

/// \brief  Shows gallery items on the display one after another.
///
/// The items are shown in a random order which is reshuffled after every
/// round. While the device is disconnected the rotation pauses and polls
/// the connection every few seconds instead of waiting the full interval.
///
/// The rotation runs as a task on the io_context: a timer on a strand
/// paces it and each upload is posted to the thread_pool so it never
/// blocks the event loop. stop() cancels the pending timer immediately.
/// At most one rotation is active; start() replaces the current one.
class RotationScheduler
{
public:
	RotationScheduler(
		boost::asio::io_context& ioc,
		boost::asio::thread_pool& pool,
		DeviceConnection& device,
		FrameUploader& uploader,
		const Gallery& gallery,
		RotationStore& store,
		const RotationSetting& cfg
	);
	RotationScheduler(const RotationScheduler&) = delete;
	RotationScheduler& operator=(const RotationScheduler&) = delete;
	~RotationScheduler();

	[[nodiscard]] std::error_code start(const std::vector<std::string>& ids, int interval_seconds);
	[[nodiscard]] std::error_code stop();
	[[nodiscard]] std::error_code resume();
	[[nodiscard]] std::error_code add_item(const std::string& id);
	[[nodiscard]] std::error_code remove_item(const std::string& id);
	[[nodiscard]] std::error_code delete_saved_config();

	RotationStatus status() const;
	std::vector<IntervalOption> intervals() const;
	static std::string interval_label(int seconds);

	bool is_active() const;
	int consecutive_failures() const;

	/// True while a rotation task is scheduled or running.
	bool running() const;

	/// \brief  One iteration of the rotation.
	///
	/// Returns the delay before the next iteration, or std::nullopt when
	/// the rotation has nothing left to show.
	std::optional<std::chrono::milliseconds> run_once();

private:
	class Task;

	std::optional<std::chrono::milliseconds> step(const Task *owner);
	std::error_code remove_item(const std::string& id, const Task *owner);
	RotationConfig current_config() const;
	void shuffle();
	void cancel_task();

private:
	boost::asio::io_context&    m_ioc;
	boost::asio::thread_pool&   m_pool;
	DeviceConnection&           m_device;
	FrameUploader&              m_uploader;
	const Gallery&              m_gallery;
	RotationStore&              m_store;
	const RotationSetting&      m_cfg;

	// uploads are never concurrent, not even across a restart of the rotation
	std::mutex m_upload_mutex;

	mutable std::mutex m_mutex;
	bool                        m_active{false};
	bool                        m_paused{false};
	std::vector<std::string>    m_selected;
	std::vector<std::string>    m_order;
	std::size_t                 m_index{};
	int                         m_interval{};
	int                         m_failures{};
	std::mt19937                m_rand{std::random_device{}()};
	std::shared_ptr<Task>       m_task;
};

} // end of namespace pxr
