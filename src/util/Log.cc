/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the pixoo_relay
    distribution for more details.
*/

//
// Created by nestal on 1/8/18.
//

#include "Log.hh"

#ifdef SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <atomic>

namespace pxr {
namespace {

std::atomic<int> g_level{LOG_INFO};

struct LevelName
{
	std::string_view name;
	int priority;
};

const LevelName levels[] = {
	{"debug",   LOG_DEBUG},
	{"info",    LOG_INFO},
	{"notice",  LOG_NOTICE},
	{"warning", LOG_WARNING},
	{"err",     LOG_ERR},
	{"crit",    LOG_CRIT},
};

} // end of local namespace

namespace detail {

bool LogEnabled(int priority)
{
	// syslog priorities: smaller is more important
	return priority <= g_level.load(std::memory_order_relaxed);
}

void DetailLog(int priority, std::string &&line)
{
	// preprocessor is bad
#ifdef SYSTEMD_FOUND
	::sd_journal_print
#else
	syslog
#endif
	(priority, "%s", line.c_str());
}

} // end of namespace detail

void SetLogLevel(int priority)
{
	g_level = priority;
}

int LogLevel()
{
	return g_level;
}

std::optional<int> ParseLogLevel(std::string_view name)
{
	for (auto&& level : levels)
		if (level.name == name)
			return level.priority;
	return std::nullopt;
}

} // end of namespace
