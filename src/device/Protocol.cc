/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 6/10/18.
//

#include "Protocol.hh"

namespace pxr::protocol {

namespace {

nlohmann::json command(std::string_view name)
{
	return {{"Command", std::string{name}}};
}

} // end of local namespace

nlohmann::json handshake()
{
	return command(get_index);
}

nlohmann::json reset_buffer()
{
	return command(reset_gif_id);
}

nlohmann::json clear_display()
{
	return command(clear_text);
}

nlohmann::json gif_frame(std::size_t total, std::size_t offset, int width, int speed_ms, std::string base64_rgb)
{
	auto json = command(send_gif);
	json["PicNum"]      = total;
	json["PicOffset"]   = offset;
	json["PicWidth"]    = width;
	json["PicSpeed"]    = speed_ms;
	json["PicData"]     = std::move(base64_rgb);
	return json;
}

std::string_view command_name(const nlohmann::json& command)
{
	auto it = command.find("Command");
	return it != command.end() && it->is_string() ?
		std::string_view{it->get_ref<const std::string&>()} :
		std::string_view{};
}

std::optional<int> status(const nlohmann::json& response)
{
	if (!response.is_object())
		return std::nullopt;

	auto it = response.find("error_code");
	return it != response.end() && it->is_number_integer() ?
		std::optional<int>{it->get<int>()} :
		std::nullopt;
}

} // end of namespace
