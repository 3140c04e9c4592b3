/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace cot {

std::string to_hex(const unsigned char *data, std::size_t size);
std::optional<std::vector<unsigned char>> hex_to_bytes(std::string_view hex);

std::string url_encode(std::string_view in);
std::string url_decode(std::string_view in);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);

// Comma separated list with blank items removed and whitespace trimmed.
std::vector<std::string> split_list(std::string_view in, char separator = ',');

// Split "remain" into exactly "count" tokens. The last token keeps the rest of the input.
template <std::size_t count>
std::array<std::string_view, count> tokenize(std::string_view remain, std::string_view separators)
{
	static_assert(count > 0);

	std::array<std::string_view, count> result;
	for (std::size_t i = 0; i + 1 < count; ++i)
		result[i] = std::get<0>(split_left(remain, separators));
	result[count-1] = remain;
	return result;
}

} // end of namespace
