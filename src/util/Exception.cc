/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/9/18.
//

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace pxr {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

void ensure_directory(const fs::path& dir)
{
	std::error_code ec;
	fs::create_directories(dir, ec);
	if (ec || !fs::is_directory(dir))
	{
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode{ec ? ec : std::make_error_code(std::errc::not_a_directory)}
			<< Path{dir}
		);
	}
}

} // end of namespace
