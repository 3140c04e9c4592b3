/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <boost/format.hpp>

#include "config.hh"
#include <syslog.h>

#include <optional>
#include <string_view>

namespace cot {

namespace detail {
bool LogEnabled(int priority);
void DetailLog(int priority, std::string&& line);
}

/// Messages less important than \a level are dropped. With \a console they
/// are also printed to stderr, for the command line tools.
void OpenLog(const char *ident, int level, bool console);

/// "debug", "info", "notice", "warning", "err", "crit"
std::optional<int> ParseLogLevel(std::string_view name);

template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	if (!detail::LogEnabled(priority))
		return;

	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
