/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cot {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/// \brief  Time limited HMAC grants for a single chunk.
///
/// A grant authorizes fetching (videoId, quality, index) until its expiry time.
/// The signature is the lower case hex HMAC-SHA256 of
/// "videoId:quality:index:expires" keyed with the shared secret. Grants are
/// stateless and cannot be revoked.
class ChunkGrant
{
public:
	struct Grant
	{
		std::int64_t    index{};
		std::int64_t    expires{};      //!< seconds since unix epoch
		std::string     signature;

		std::string query() const;
	};

public:
	explicit ChunkGrant(std::string secret, Clock clock = {});

	Grant issue(std::string_view video_id, std::string_view quality, std::int64_t index, std::chrono::seconds ttl) const;
	std::vector<Grant> issue_batch(
		std::string_view video_id, std::string_view quality,
		std::int64_t start, std::size_t count, std::chrono::seconds ttl
	) const;

	/// Returns Error::grant_expired or Error::signature_mismatch for invalid grants.
	/// Expiry is reported even when the signature also mismatches.
	std::error_code verify(
		std::string_view video_id, std::string_view quality, std::int64_t index,
		std::int64_t expires, std::string_view signature
	) const;

	std::string sign(std::string_view video_id, std::string_view quality, std::int64_t index, std::int64_t expires) const;

	std::int64_t now() const;

private:
	std::string m_secret;
	Clock       m_clock;
};

} // end of namespace cot
