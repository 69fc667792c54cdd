/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#pragma once

#include "util/FS.hh"

#include <opencv2/imgcodecs.hpp>

#include <functional>
#include <optional>
#include <vector>
#include <system_error>

namespace pxr {

class DeviceConnection;
struct DeviceSetting;

struct UploadResult
{
	std::size_t frames_sent{};
	int         speed_ms{};
};

/// \brief  Pushes animations to the display.
///
/// An upload is a reset-buffer command followed by one command per frame.
/// The first failure aborts the upload, and whatever frames were already
/// sent stay in the device buffer.
class FrameUploader
{
public:
	/// Called with (frame number starting from 1, total frames) before each frame is sent.
	using ProgressCallback = std::function<void(std::size_t, std::size_t)>;
	using Loader = std::function<cv::Animation(const fs::path&, std::error_code&)>;

public:
	FrameUploader(DeviceConnection& device, const DeviceSetting& cfg, Loader loader = {});

	/// Fails with Error::too_many_frames before sending anything if the file
	/// has more frames than the display accepts. Without \a speed_ms the
	/// average frame duration of the file is used, but never less than the
	/// minimum speed of the display.
	UploadResult upload_gif(
		const fs::path& path,
		std::optional<int> speed_ms,
		const ProgressCallback& progress,
		std::error_code& ec
	);

	UploadResult upload(const cv::Animation& anim, std::optional<int> speed_ms, const ProgressCallback& progress, std::error_code& ec);

	/// Show a still frame, e.g. a solid background.
	void upload_single_frame(const cv::Mat& frame, std::error_code& ec);

	void clear_display(std::error_code& ec);

	int average_speed(const std::vector<int>& durations) const;

private:
	DeviceConnection&       m_device;
	const DeviceSetting&    m_cfg;
	Loader                  m_loader;
};

} // end of namespace pxr
