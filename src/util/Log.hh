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

#include <boost/format.hpp>

#include <syslog.h>

#include <optional>
#include <string>
#include <string_view>

namespace pxr {

namespace detail {
bool LogEnabled(int priority);
void DetailLog(int priority, std::string&& line);
}

/// Messages less important than \a priority are dropped. The default is
/// LOG_INFO.
void SetLogLevel(int priority);
int LogLevel();

/// Parse "debug", "info", "notice", "warning", "err" or "crit".
std::optional<int> ParseLogLevel(std::string_view name);

/// \brief  Write one line to the system log.
/// \param  priority    One of the syslog LOG_xxx priorities.
/// \param  fmt         boost::format string, i.e. "%1% %2%"
template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	// skip formatting the frames of a debug message nobody reads
	if (!detail::LogEnabled(priority))
		return;

	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
