/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 2/4/18.
//

#include "Base64.hh"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>

namespace pxr {

namespace it = boost::archive::iterators;

std::string base64_encode(const void *data, std::size_t size)
{
	using Encoder = it::base64_from_binary<it::transform_width<const char*, 6, 8>>;

	auto begin = static_cast<const char*>(data);
	std::string result{Encoder{begin}, Encoder{begin + size}};

	// transform_width does not pad
	result.append((3 - size % 3) % 3, '=');
	return result;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view in)
{
	using Decoder = it::transform_width<it::binary_from_base64<std::string::const_iterator>, 8, 6>;

	if (in.size() % 4 != 0)
		return std::nullopt;

	auto padding = static_cast<std::size_t>(in.size() - in.find_last_not_of('=') - 1);
	if (in.empty())
		padding = 0;
	if (padding > 2)
		return std::nullopt;

	// binary_from_base64 does not understand the padding either
	std::string str{in};
	std::replace(str.end() - static_cast<std::ptrdiff_t>(padding), str.end(), '=', 'A');

	try
	{
		std::vector<std::uint8_t> result{Decoder{str.cbegin()}, Decoder{str.cend()}};
		result.resize(result.size() - padding);
		return result;
	}
	catch (it::dataflow_exception&)
	{
		return std::nullopt;
	}
}

} // end of namespace pxr
