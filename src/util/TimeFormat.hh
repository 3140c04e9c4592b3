/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cot {

// chunk index containing the timestamp: floor(seconds / chunk_duration)
std::int64_t timestamp_to_index(double seconds, std::uint32_t chunk_duration);

// start time of the chunk
double index_to_timestamp(std::int64_t index, std::uint32_t chunk_duration);

/// Parse "HH:MM:SS", "MM:SS" or "SS". Every field may be fractional.
/// Throws ValidationError for malformed or negative input.
double parse_time_string(std::string_view text);

/// Parse a playback position: a bare number of seconds or a time string.
double parse_timestamp(std::string_view text);

/// "MM:SS", or "HH:MM:SS" when the duration is one hour or longer.
std::string format_duration(double seconds);

} // end of namespace cot
