/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the pixoo_relay
	distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#include "Animation.hh"

#include "util/Base64.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <opencv2/imgproc.hpp>

namespace pxr {

namespace {

cv::Animation read_frames(const std::string& file)
{
	cv::Animation anim;
	if (cv::imreadanimation(file, anim) && !anim.frames.empty())
		return anim;

	// formats without animation support in this OpenCV build, e.g. multi-page TIFF
	anim = cv::Animation{};
	std::vector<cv::Mat> pages;
	if (cv::imreadmulti(file, pages, cv::IMREAD_UNCHANGED) && !pages.empty())
		anim.frames = std::move(pages);

	else if (auto still = cv::imread(file, cv::IMREAD_UNCHANGED); !still.empty())
		anim.frames.push_back(std::move(still));

	return anim;
}

} // end of local namespace

cv::Animation load_animation(const fs::path& path, std::error_code& ec)
{
	cv::Animation anim;
	try
	{
		anim = read_frames(path.string());
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "OpenCV cannot read %1%: %2%", path, e.what());
		anim = cv::Animation{};
	}

	if (anim.frames.empty())
	{
		ec = Error::invalid_image;
		return anim;
	}

	anim.durations.resize(anim.frames.size(), 0);
	for (auto& duration : anim.durations)
		if (duration <= 0)
			duration = default_frame_duration_ms;

	ec.clear();
	return anim;
}

std::vector<std::uint8_t> to_rgb(const cv::Mat& frame, int width, int height, std::error_code& ec)
{
	if (frame.empty() || width <= 0 || height <= 0)
	{
		ec = Error::invalid_image;
		return {};
	}

	cv::Mat rgb;
	try
	{
		cv::Mat src = frame;
		if (src.depth() != CV_8U)
			src.convertTo(src, CV_8U, src.depth() == CV_16U ? 1.0/256 : 1.0);

		switch (src.channels())
		{
			case 1: cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB); break;
			case 2:
			{
				// grey + alpha: drop the alpha
				cv::Mat grey;
				cv::extractChannel(src, grey, 0);
				cv::cvtColor(grey, rgb, cv::COLOR_GRAY2RGB);
				break;
			}
			case 3: cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB); break;
			case 4: cv::cvtColor(src, rgb, cv::COLOR_BGRA2RGB); break;
			default:
				Log(LOG_WARNING, "cannot convert a frame with %1% channels", src.channels());
				ec = Error::invalid_image;
				return {};
		}

		if (rgb.cols != width || rgb.rows != height)
			cv::resize(rgb, rgb, cv::Size{width, height}, 0, 0, cv::INTER_NEAREST);
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot convert frame to RGB: %1%", e.what());
		ec = Error::invalid_image;
		return {};
	}

	if (!rgb.isContinuous())
		rgb = rgb.clone();

	ec.clear();
	return {rgb.datastart, rgb.dataend};
}

std::string encode_frame(const cv::Mat& frame, int width, int height, std::error_code& ec)
{
	auto rgb = to_rgb(frame, width, height, ec);
	return ec ? std::string{} : base64_encode(rgb);
}

} // end of namespace pxr
