/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 4/3/18.
//

#include "RotationScheduler.hh"

#include "Gallery.hh"
#include "RotationConfig.hh"

#include "device/DeviceConnection.hh"
#include "device/FrameUploader.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>

namespace pxr {

/// One run of the rotation. A new Task is created by every start(), so a
/// cancelled Task that is still finishing an upload cannot touch the state
/// of its successor.
class RotationScheduler::Task : public std::enable_shared_from_this<Task>
{
public:
	explicit Task(RotationScheduler& parent) :
		m_parent{parent},
		m_strand{boost::asio::make_strand(parent.m_ioc)},
		m_timer{m_strand}
	{
	}

	void schedule(std::chrono::milliseconds delay)
	{
		boost::asio::post(m_strand, [self=shared_from_this(), delay]
		{
			if (self->m_stopped)
				return;

			self->m_timer.expires_after(delay);
			self->m_timer.async_wait([self](boost::system::error_code ec){self->on_timer(ec);});
		});
	}

	void cancel()
	{
		m_stopped = true;
		boost::asio::post(m_strand, [self=shared_from_this()]{self->m_timer.cancel();});
	}

	bool stopped() const {return m_stopped;}

	/// Block until the iteration in progress, if any, has finished.
	void wait()
	{
		std::unique_lock lock{m_busy};
	}

private:
	void on_timer(boost::system::error_code ec)
	{
		if (ec || m_stopped)
			return;

		// The work guard keeps io_context::run() from returning while the
		// upload is in progress on the pool.
		boost::asio::post(
			m_parent.m_pool,
			[self=shared_from_this(), work=boost::asio::make_work_guard(m_parent.m_ioc)]
			{
				if (auto next = self->run(); next)
					self->schedule(*next);
			}
		);
	}

	std::optional<std::chrono::milliseconds> run()
	{
		std::unique_lock lock{m_busy};
		if (m_stopped)
			return std::nullopt;

		try
		{
			auto next = m_parent.step(this);
			if (!next)
			{
				Log(LOG_INFO, "rotation loop finished");
				m_stopped = true;
			}
			return next;
		}
		catch (std::exception& e)
		{
			Log(LOG_ERR, "error in rotation loop: %1%", e.what());
			return m_parent.m_cfg.error_pause;
		}
	}

private:
	RotationScheduler& m_parent;

	boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
	boost::asio::steady_timer m_timer;

	std::atomic<bool> m_stopped{false};
	std::mutex m_busy;
};

void to_json(nlohmann::json& json, const RotationStatus& status)
{
	json = nlohmann::json{
		{"is_active",           status.is_active},
		{"is_paused",           status.is_paused},
		{"selected_ids",        status.selected_ids},
		{"selected_count",      status.selected_ids.size()},
		{"interval_seconds",    status.interval_seconds},
		{"interval_label",      status.interval_label},
		{"current_index",       status.current_index},
		{"has_saved_config",    status.has_saved_config}
	};
}

RotationScheduler::RotationScheduler(
	boost::asio::io_context& ioc,
	boost::asio::thread_pool& pool,
	DeviceConnection& device,
	FrameUploader& uploader,
	const Gallery& gallery,
	RotationStore& store,
	const RotationSetting& cfg
) :
	m_ioc{ioc}, m_pool{pool}, m_device{device}, m_uploader{uploader},
	m_gallery{gallery}, m_store{store}, m_cfg{cfg}
{
}

RotationScheduler::~RotationScheduler()
{
	std::shared_ptr<Task> task;
	{
		std::unique_lock lock{m_mutex};
		task = std::move(m_task);
	}
	if (task)
	{
		task->cancel();
		task->wait();
	}
}

std::error_code RotationScheduler::start(const std::vector<std::string>& ids, int interval_seconds)
{
	if (std::find(m_cfg.intervals.begin(), m_cfg.intervals.end(), interval_seconds) == m_cfg.intervals.end())
	{
		Log(LOG_WARNING, "invalid rotation interval: %1%", interval_seconds);
		return Error::invalid_interval;
	}
	if (ids.empty())
		return Error::empty_selection;

	std::vector<std::string> valid;
	for (auto&& id : ids)
	{
		if (std::find(valid.begin(), valid.end(), id) != valid.end())
			continue;

		if (m_gallery.exists(id))
			valid.push_back(id);
		else
			Log(LOG_DEBUG, "ignoring unknown item %1%", id);
	}
	if (valid.empty())
	{
		Log(LOG_WARNING, "none of the %1% item(s) to rotate exists", ids.size());
		return Error::unknown_item;
	}

	std::unique_lock lock{m_mutex};

	// save first: a rotation that cannot be resumed later is not started
	std::error_code ec;
	m_store.save(RotationConfig{valid, interval_seconds, Timestamp::now()}, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot save rotation config: %1%", ec.message());
		return ec;
	}

	if (m_active)
		Log(LOG_INFO, "replacing the active rotation");
	cancel_task();

	m_selected  = std::move(valid);
	m_interval  = interval_seconds;
	m_failures  = 0;
	m_active    = true;
	m_paused    = false;
	shuffle();

	m_task = std::make_shared<Task>(*this);
	m_task->schedule(std::chrono::milliseconds{0});

	Log(LOG_INFO, "rotation started: %1% item(s), every %2%", m_selected.size(), interval_label(m_interval));
	return {};
}

std::error_code RotationScheduler::stop()
{
	std::unique_lock lock{m_mutex};
	if (!m_active)
		return Error::rotation_inactive;

	cancel_task();
	m_active = false;
	m_paused = false;

	// keep the config so the rotation can be resumed
	std::error_code ec;
	m_store.save(current_config(), ec);
	Log(LOG_INFO, "rotation stopped");
	return ec;
}

std::error_code RotationScheduler::resume()
{
	std::error_code ec;
	auto saved = m_store.load(ec);
	if (ec)
		return ec;
	if (!saved)
	{
		Log(LOG_NOTICE, "no saved rotation to resume");
		return Error::no_saved_config;
	}

	std::vector<std::string> survivors;
	std::copy_if(
		saved->selected_ids.begin(), saved->selected_ids.end(), std::back_inserter(survivors),
		[this](auto& id){return m_gallery.exists(id);}
	);
	if (survivors.size() < saved->selected_ids.size())
		Log(LOG_NOTICE, "%1% item(s) of the saved rotation no longer exist", saved->selected_ids.size() - survivors.size());

	if (survivors.empty())
		return Error::empty_selection;

	return start(survivors, saved->interval_seconds);
}

std::error_code RotationScheduler::add_item(const std::string& id)
{
	if (!m_gallery.exists(id))
		return Error::unknown_item;

	std::unique_lock lock{m_mutex};
	if (!m_active)
		return Error::rotation_inactive;

	if (std::find(m_selected.begin(), m_selected.end(), id) != m_selected.end())
		return {};

	m_selected.push_back(id);
	m_order.push_back(id);

	std::error_code ec;
	m_store.save(current_config(), ec);
	Log(LOG_INFO, "item %1% added to rotation", id);
	return ec;
}

std::error_code RotationScheduler::remove_item(const std::string& id)
{
	return remove_item(id, nullptr);
}

std::error_code RotationScheduler::remove_item(const std::string& id, const Task *owner)
{
	std::unique_lock lock{m_mutex};
	if (owner && m_task.get() != owner)
		return {};
	if (!m_active)
		return Error::rotation_inactive;

	auto it = std::find(m_selected.begin(), m_selected.end(), id);
	if (it == m_selected.end())
		return Error::unknown_item;
	m_selected.erase(it);

	if (auto pos = std::find(m_order.begin(), m_order.end(), id); pos != m_order.end())
	{
		auto removed = static_cast<std::size_t>(pos - m_order.begin());
		m_order.erase(pos);

		// the item at m_index moved one step forward
		if (removed < m_index)
			--m_index;
	}

	std::error_code ec;
	if (m_selected.empty())
	{
		cancel_task();
		m_active = false;
		m_paused = false;
		m_store.remove(ec);
		Log(LOG_INFO, "rotation stopped: no item left");
		return ec;
	}

	m_store.save(current_config(), ec);
	Log(LOG_INFO, "item %1% removed from rotation", id);
	return ec;
}

std::error_code RotationScheduler::delete_saved_config()
{
	if (!m_store.exists())
		return Error::no_saved_config;

	std::error_code ec;
	m_store.remove(ec);
	return ec;
}

RotationStatus RotationScheduler::status() const
{
	std::unique_lock lock{m_mutex};

	RotationStatus status;
	status.is_active        = m_active;
	status.is_paused        = m_paused;
	status.interval_seconds = m_interval;
	status.current_index    = m_index;

	if (m_active)
		status.selected_ids = m_selected;

	else
	{
		std::error_code ec;
		if (auto saved = m_store.load(ec); saved)
		{
			status.has_saved_config = true;
			status.interval_seconds = saved->interval_seconds;
			std::copy_if(
				saved->selected_ids.begin(), saved->selected_ids.end(), std::back_inserter(status.selected_ids),
				[this](auto& id){return m_gallery.exists(id);}
			);
		}
	}

	status.interval_label = interval_label(status.interval_seconds);
	return status;
}

std::vector<IntervalOption> RotationScheduler::intervals() const
{
	std::vector<IntervalOption> result;
	for (auto seconds : m_cfg.intervals)
		result.push_back(IntervalOption{seconds, interval_label(seconds)});
	return result;
}

std::string RotationScheduler::interval_label(int seconds)
{
	if (seconds <= 0)
		return {};

	if (seconds % 60 != 0)
		return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");

	auto minutes = seconds / 60;
	return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
}

bool RotationScheduler::is_active() const
{
	std::unique_lock lock{m_mutex};
	return m_active;
}

int RotationScheduler::consecutive_failures() const
{
	std::unique_lock lock{m_mutex};
	return m_failures;
}

bool RotationScheduler::running() const
{
	std::unique_lock lock{m_mutex};
	return m_task && !m_task->stopped();
}

std::optional<std::chrono::milliseconds> RotationScheduler::run_once()
{
	return step(nullptr);
}

std::optional<std::chrono::milliseconds> RotationScheduler::step(const Task *owner)
{
	// only call with m_mutex locked
	auto superseded = [this, owner]{return !m_active || (owner && m_task.get() != owner);};

	if (!m_device.is_connected())
	{
		std::unique_lock lock{m_mutex};
		if (superseded())
			return std::nullopt;

		if (!m_paused)
		{
			m_paused = true;
			Log(LOG_NOTICE, "rotation paused: device disconnected");
		}
		return m_cfg.reconnect_poll;
	}

	std::string id;
	std::chrono::seconds interval;
	std::size_t position{}, total{};
	{
		std::unique_lock lock{m_mutex};
		if (superseded())
			return std::nullopt;

		if (m_paused)
		{
			m_paused = false;
			Log(LOG_NOTICE, "rotation resumed: device reconnected");
		}

		if (m_order.empty())
		{
			Log(LOG_WARNING, "rotation list is empty");
			return std::nullopt;
		}

		if (m_index >= m_order.size())
		{
			shuffle();
			Log(LOG_DEBUG, "rotation round complete, reshuffled");
		}

		id       = m_order[m_index];
		interval = std::chrono::seconds{m_interval};
		position = m_index + 1;
		total    = m_order.size();
	}

	auto path = m_gallery.path(id);
	if (!path)
	{
		Log(LOG_WARNING, "rotation item %1% not found, removing it", id);
		if (auto ec = remove_item(id, owner); ec)
			Log(LOG_WARNING, "cannot remove %1% from rotation: %2%", id, ec.message());
		return std::chrono::milliseconds{0};
	}

	std::error_code ec;
	UploadResult result;
	{
		std::unique_lock lock{m_upload_mutex};
		result = m_uploader.upload_gif(*path, std::nullopt, {}, ec);
	}

	std::unique_lock lock{m_mutex};

	// stopped or restarted during the upload: the counters belong to someone else now
	if (superseded())
		return std::nullopt;

	if (ec)
	{
		++m_failures;
		Log(LOG_WARNING, "cannot show %1%: %2% (%3%/%4%)", id, ec.message(), m_failures, m_cfg.max_failures);
		if (m_failures >= m_cfg.max_failures)
		{
			Log(LOG_ERR, "too many consecutive failures, skipping item");
			m_failures = 0;
		}
	}
	else
	{
		m_failures = 0;
		Log(LOG_INFO, "rotation: %1% (%2% frames) [%3%/%4%]", id, result.frames_sent, position, total);
	}

	++m_index;
	return interval;
}

RotationConfig RotationScheduler::current_config() const
{
	return RotationConfig{m_selected, m_interval, Timestamp::now()};
}

void RotationScheduler::shuffle()
{
	m_order = m_selected;
	std::shuffle(m_order.begin(), m_order.end(), m_rand);
	m_index = 0;
}

void RotationScheduler::cancel_task()
{
	if (m_task)
	{
		m_task->cancel();
		m_task.reset();
	}
}

} // end of namespace pxr
