/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#include "Random.hh"

#include <boost/algorithm/hex.hpp>

#include <cerrno>
#include <iterator>
#include <system_error>
#include <vector>

#include <sys/random.h>

namespace pxr {

void secure_random(void *buf, std::size_t size)
{
	if (::getrandom(buf, size, 0) != static_cast<ssize_t>(size))
		throw std::system_error(errno, std::generic_category());
}

std::string random_hex(std::size_t bytes)
{
	std::vector<unsigned char> buf(bytes);
	secure_random(buf.data(), buf.size());

	std::string result;
	boost::algorithm::hex_lower(buf.begin(), buf.end(), std::back_inserter(result));
	return result;
}

} // end of namespace pxr
