/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "TimeFormat.hh"

#include "Escape.hh"
#include "Exception.hh"

#include <boost/exception/info.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

namespace cot {
namespace {

[[noreturn]] void invalid_time(std::string_view text)
{
	BOOST_THROW_EXCEPTION(ValidationError()
		<< Message{"Invalid timestamp"}
		<< BadInput{std::string{text}}
	);
}

double parse_number(std::string_view field, std::string_view text)
{
	if (field.empty() || field.front() == '-' || field.front() == '+' || std::isspace(static_cast<unsigned char>(field.front())))
		invalid_time(text);

	std::string str{field};
	char *end{};
	auto value = std::strtod(str.c_str(), &end);
	if (end != str.c_str() + str.size() || !std::isfinite(value) || value < 0)
		invalid_time(text);

	return value;
}

} // end of local namespace

std::int64_t timestamp_to_index(double seconds, std::uint32_t chunk_duration)
{
	auto index = std::floor(seconds / chunk_duration);

	// 2^63 is exactly representable and is the first value that does not fit
	if (!(index < 9223372036854775808.0))
		return std::numeric_limits<std::int64_t>::max();
	return static_cast<std::int64_t>(index);
}

double index_to_timestamp(std::int64_t index, std::uint32_t chunk_duration)
{
	return static_cast<double>(index) * chunk_duration;
}

double parse_time_string(std::string_view text)
{
	std::vector<double> parts;
	auto remain = text;
	while (true)
	{
		auto [field, match] = split_left(remain, ":");
		parts.push_back(parse_number(field, text));
		if (match != ':')
			break;
	}

	switch (parts.size())
	{
		case 1: return parts[0];
		case 2: return parts[0] * 60 + parts[1];
		case 3: return parts[0] * 3600 + parts[1] * 60 + parts[2];
		default: invalid_time(text);
	}
}

double parse_timestamp(std::string_view text)
{
	return text.find(':') != text.npos ? parse_time_string(text) : parse_number(text, text);
}

std::string format_duration(double seconds)
{
	auto total = static_cast<long>(std::floor(std::max(seconds, 0.0)));
	auto hrs  = total / 3600;
	auto mins = (total % 3600) / 60;
	auto secs = total % 60;

	char buf[32];
	if (hrs > 0)
		std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", hrs, mins, secs);
	else
		std::snprintf(buf, sizeof(buf), "%02ld:%02ld", mins, secs);
	return buf;
}

} // end of namespace cot
