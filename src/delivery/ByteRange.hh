/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cot {

/// Inclusive byte range of an entity.
struct ByteRange
{
	std::uint64_t start{};
	std::uint64_t end{};
	std::uint64_t length{};

	std::string content_range(std::uint64_t size) const;
	bool operator==(const ByteRange& rhs) const {return start == rhs.start && end == rhs.end && length == rhs.length;}
};

/// Parse a single "bytes=start-end" range, either bound may be omitted.
/// Returns nullopt when the whole entity should be served instead.
std::optional<ByteRange> parse_byte_range(std::optional<std::string_view> header, std::uint64_t size);

} // end of namespace cot
