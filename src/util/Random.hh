/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#pragma once

#include <cstddef>
#include <string>

namespace pxr {

/// Fill \a buf with bytes from the kernel's random source. Throws
/// std::system_error if it cannot.
void secure_random(void *buf, std::size_t size);

/// Lower case hex string of \a bytes random bytes, i.e. 2*bytes characters.
std::string random_hex(std::size_t bytes);

} // end of namespace pxr
