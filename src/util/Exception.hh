/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#pragma once

#include "FS.hh"

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <string>
#include <system_error>

namespace pxr {

/// Base class of the exceptions thrown during start-up. Device and
/// validation failures are reported by std::error_code instead.
struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};

using ErrorCode = boost::error_info<struct tag_error_code,  std::error_code>;
using Path      = boost::error_info<struct tag_path,        fs::path>;
using Message   = boost::error_info<struct tag_message,     std::string>;

/// Create \a dir and its parents if they are not there yet. Throws
/// SystemError with the ErrorCode and Path attached on failure.
void ensure_directory(const fs::path& dir);

} // end of namespace
