/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#include "FrameUploader.hh"

#include "DeviceConnection.hh"
#include "Protocol.hh"

#include "image/Animation.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <algorithm>
#include <numeric>

namespace pxr {

FrameUploader::FrameUploader(DeviceConnection& device, const DeviceSetting& cfg, Loader loader) :
	m_device{device}, m_cfg{cfg}, m_loader{loader ? std::move(loader) : Loader{&load_animation}}
{
}

UploadResult FrameUploader::upload_gif(
	const fs::path& path,
	std::optional<int> speed_ms,
	const ProgressCallback& progress,
	std::error_code& ec
)
{
	if (!m_device.is_connected())
	{
		ec = Error::not_connected;
		return {};
	}

	auto anim = m_loader(path, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot load %1%: %2%", path, ec.message());
		return {};
	}

	if (anim.frames.size() > m_cfg.max_frames)
	{
		Log(LOG_WARNING, "%1% has %2% frames, the display accepts at most %3%", path, anim.frames.size(), m_cfg.max_frames);
		ec = Error::too_many_frames;
		return {};
	}

	return upload(anim, speed_ms, progress, ec);
}

UploadResult FrameUploader::upload(
	const cv::Animation& anim,
	std::optional<int> speed_ms,
	const ProgressCallback& progress,
	std::error_code& ec
)
{
	if (anim.frames.size() > m_cfg.max_frames)
	{
		ec = Error::too_many_frames;
		return {};
	}
	if (anim.frames.empty())
	{
		ec = Error::invalid_image;
		return {};
	}

	auto speed = speed_ms.value_or(average_speed(anim.durations));

	// encode everything first so that a bad frame sends nothing
	std::vector<std::string> payloads;
	payloads.reserve(anim.frames.size());
	for (auto&& frame : anim.frames)
	{
		payloads.push_back(encode_frame(frame, m_cfg.width, m_cfg.height, ec));
		if (ec)
		{
			Log(LOG_WARNING, "cannot encode frame %1% of %2%: %3%", payloads.size(), anim.frames.size(), ec.message());
			return {};
		}
	}

	m_device.send_command(protocol::reset_buffer(), ec);
	if (ec)
	{
		if (ec == Error::command_failed)
			ec = Error::upload_failed;
		Log(LOG_WARNING, "cannot reset animation buffer: %1%", ec.message());
		return {};
	}

	UploadResult result{0, speed};
	auto total = anim.frames.size();
	for (auto offset = 0U; offset < total; ++offset)
	{
		if (progress)
			progress(offset + 1, total);

		m_device.send_command(protocol::gif_frame(total, offset, m_cfg.width, speed, payloads[offset]), ec);
		if (ec)
		{
			if (ec == Error::command_failed)
				ec = Error::upload_failed;
			Log(LOG_WARNING, "upload aborted at frame %1% of %2%: %3%", offset + 1, total, ec.message());
			return result;
		}
		++result.frames_sent;
	}

	Log(LOG_INFO, "uploaded %1% frame(s) at %2% ms per frame", result.frames_sent, speed);
	ec.clear();
	return result;
}

void FrameUploader::upload_single_frame(const cv::Mat& frame, std::error_code& ec)
{
	cv::Animation still;
	still.frames.push_back(frame);
	still.durations.push_back(1000);
	upload(still, 1000, {}, ec);
}

void FrameUploader::clear_display(std::error_code& ec)
{
	m_device.send_command(protocol::clear_display(), ec);
	if (ec == Error::command_failed)
		ec = Error::upload_failed;
}

int FrameUploader::average_speed(const std::vector<int>& durations) const
{
	if (durations.empty())
		return m_cfg.min_speed_ms;

	auto sum = std::accumulate(durations.begin(), durations.end(), 0LL);
	return std::max(m_cfg.min_speed_ms, static_cast<int>(sum / static_cast<long long>(durations.size())));
}

} // end of namespace pxr
