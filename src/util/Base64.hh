/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/4/18.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pxr {

std::string base64_encode(const void *data, std::size_t size);

template <typename Container>
std::string base64_encode(const Container& bytes)
{
	return base64_encode(bytes.data(), bytes.size());
}

/// Returns std::nullopt if the input contains characters outside the base64 alphabet.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view in);

} // end of namespace pxr
