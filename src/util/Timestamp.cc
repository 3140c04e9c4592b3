/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "Timestamp.hh"
#include "Exception.hh"

#include <boost/exception/info.hpp>

#include <cstdio>
#include <ctime>
#include <ostream>

namespace cot {

using namespace std::chrono;

Timestamp Timestamp::now()
{
	return from(system_clock::now());
}

Timestamp Timestamp::from(system_clock::time_point tp)
{
	return Timestamp{time_point_cast<milliseconds>(tp)};
}

std::string Timestamp::iso8601() const
{
	auto ms   = time_since_epoch().count();
	auto secs = static_cast<std::time_t>(ms / 1000);
	auto frac = static_cast<int>(ms % 1000);
	if (frac < 0)
	{
		--secs;
		frac += 1000;
	}

	std::tm tm{};
	::gmtime_r(&secs, &tm);

	char buf[40];
	std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
		tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
		tm.tm_hour, tm.tm_min, tm.tm_sec, frac
	);
	return buf;
}

std::optional<Timestamp> Timestamp::parse(std::string_view iso8601)
{
	std::string str{iso8601};

	std::tm tm{};
	int ms = 0;
	auto matched = std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
		&tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms);
	if (matched < 6)
		return std::nullopt;

	tm.tm_year -= 1900;
	tm.tm_mon  -= 1;
	return Timestamp{seconds{::timegm(&tm)} + milliseconds{ms}};
}

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.iso8601();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	if (json.is_number())
		output = Timestamp{milliseconds{json.get<std::int64_t>()}};
	else if (auto tp = Timestamp::parse(json.get<std::string>()))
		output = *tp;
	else
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"invalid timestamp"} << BadInput{json.get<std::string>()});
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.iso8601();
}

} // end of namespace cot
