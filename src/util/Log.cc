/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Log.hh"

#ifdef SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <atomic>
#include <cstdio>

namespace cot {
namespace {

std::atomic<int>  g_level{LOG_DEBUG};
std::atomic<bool> g_console{false};

} // end of local namespace

void OpenLog(const char *ident, int level, bool console)
{
	g_level   = level;
	g_console = console;
	::openlog(ident, LOG_PID, LOG_DAEMON);
}

std::optional<int> ParseLogLevel(std::string_view name)
{
	static const std::pair<std::string_view, int> levels[] = {
		{"debug",   LOG_DEBUG},
		{"info",    LOG_INFO},
		{"notice",  LOG_NOTICE},
		{"warning", LOG_WARNING},
		{"err",     LOG_ERR},
		{"crit",    LOG_CRIT}
	};
	for (auto&& [text, level] : levels)
		if (text == name)
			return level;
	return std::nullopt;
}

namespace detail {

bool LogEnabled(int priority)
{
	return LOG_PRI(priority) <= g_level;
}

void DetailLog(int priority, std::string &&line)
{
	// one call per line so lines from different threads don't interleave
	if (g_console)
		std::fprintf(stderr, "%s\n", line.c_str());

	// the journal keeps the priority, syslog falls back to the facility set by openlog()
#ifdef SYSTEMD_FOUND
	::sd_journal_print
#else
	syslog
#endif
	(priority, "%s", line.c_str());
}

}} // end of namespace
