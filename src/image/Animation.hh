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

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace pxr {

/// Used when the file does not say how long a frame should be shown.
constexpr int default_frame_duration_ms = 100;

/// \brief  Load every frame of an animated image with its duration.
///
/// A still image becomes a one-frame animation. Frame durations of zero
/// are replaced by default_frame_duration_ms. Fails with
/// Error::invalid_image if the file cannot be decoded.
cv::Animation load_animation(const fs::path& path, std::error_code& ec);

/// Convert a grey, grey+alpha, BGR or BGRA frame to packed RGB of exactly
/// width*height*3 bytes, resizing with nearest-neighbour interpolation if
/// needed. Fails with Error::invalid_image for an empty frame or one OpenCV
/// cannot convert.
std::vector<std::uint8_t> to_rgb(const cv::Mat& frame, int width, int height, std::error_code& ec);

/// to_rgb() followed by base64.
std::string encode_frame(const cv::Mat& frame, int width, int height, std::error_code& ec);

} // end of namespace pxr
