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
#include <vector>

namespace cot {

using SHA256Digest = std::array<unsigned char, 32>;

SHA256Digest hmac_sha256(std::string_view key, std::string_view message);

// Compare in time independent of the content. Sizes are not secret.
bool constant_time_equal(const void *lhs, std::size_t lhs_size, const void *rhs, std::size_t rhs_size);

// RFC 4648 section 5, without padding
std::string base64url_encode(const void *data, std::size_t size);
std::optional<std::vector<unsigned char>> base64url_decode(std::string_view in);

} // end of namespace cot
