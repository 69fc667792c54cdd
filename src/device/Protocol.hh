/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 6/10/18.
//

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

/// Commands understood by the display. Every request is an HTTP POST of a
/// JSON object carrying a "Command" field; every response carries an
/// "error_code" field which is zero on success.
namespace pxr::protocol {

constexpr std::string_view get_index        = "Channel/GetIndex";
constexpr std::string_view reset_gif_id     = "Draw/ResetHttpGifId";
constexpr std::string_view send_gif         = "Draw/SendHttpGif";
constexpr std::string_view clear_text       = "Draw/ClearHttpText";

/// The handshake: cheapest command the device answers.
nlohmann::json handshake();

/// Must be sent before the first frame of a new animation.
nlohmann::json reset_buffer();

nlohmann::json clear_display();

nlohmann::json gif_frame(
	std::size_t total,
	std::size_t offset,
	int         width,
	int         speed_ms,
	std::string base64_rgb
);

std::string_view command_name(const nlohmann::json& command);

/// The "error_code" of a response, or std::nullopt if the response is not
/// the envelope we expect.
std::optional<int> status(const nlohmann::json& response);

} // end of namespace
