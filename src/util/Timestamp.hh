/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cot {

using TimePointBase = std::chrono::time_point<
    std::chrono::system_clock,
	std::chrono::milliseconds
>;

/// \brief  Wall clock time with millisecond resolution.
/// Serialized as an ISO-8601 UTC string, e.g. "2018-05-27T08:10:02.123Z".
struct Timestamp : TimePointBase
{
	using time_point::time_point;
	Timestamp(TimePointBase tp) : Timestamp{tp.time_since_epoch()} {}

	static Timestamp now();
	static Timestamp from(std::chrono::system_clock::time_point tp);
	static std::optional<Timestamp> parse(std::string_view iso8601);

	std::string iso8601() const;
};

void to_json(nlohmann::json& json, const Timestamp& input);
void from_json(const nlohmann::json& json, Timestamp& output);

std::ostream& operator<<(std::ostream& os, Timestamp tp);

} // end of namespace cot
