/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "ChunkGrant.hh"
#include "HMAC.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

namespace cot {
namespace {

std::string grant_message(std::string_view video_id, std::string_view quality, std::int64_t index, std::int64_t expires)
{
	std::string msg{video_id};
	msg.push_back(':');
	msg.append(quality);
	msg.push_back(':');
	msg.append(std::to_string(index));
	msg.push_back(':');
	msg.append(std::to_string(expires));
	return msg;
}

} // end of local namespace

std::string ChunkGrant::Grant::query() const
{
	return "expires=" + std::to_string(expires) + "&signature=" + signature;
}

ChunkGrant::ChunkGrant(std::string secret, Clock clock) :
	m_secret{std::move(secret)},
	m_clock{clock ? std::move(clock) : Clock{[]{return std::chrono::system_clock::now();}}}
{
}

std::int64_t ChunkGrant::now() const
{
	return std::chrono::duration_cast<std::chrono::seconds>(m_clock().time_since_epoch()).count();
}

std::string ChunkGrant::sign(std::string_view video_id, std::string_view quality, std::int64_t index, std::int64_t expires) const
{
	auto mac = hmac_sha256(m_secret, grant_message(video_id, quality, index, expires));
	return to_hex(mac.data(), mac.size());
}

ChunkGrant::Grant ChunkGrant::issue(
	std::string_view video_id, std::string_view quality, std::int64_t index, std::chrono::seconds ttl
) const
{
	auto expires = now() + ttl.count();
	return {index, expires, sign(video_id, quality, index, expires)};
}

std::vector<ChunkGrant::Grant> ChunkGrant::issue_batch(
	std::string_view video_id, std::string_view quality,
	std::int64_t start, std::size_t count, std::chrono::seconds ttl
) const
{
	std::vector<Grant> result;
	result.reserve(count);
	for (std::size_t i = 0; i < count; ++i)
		result.push_back(issue(video_id, quality, start + static_cast<std::int64_t>(i), ttl));
	return result;
}

std::error_code ChunkGrant::verify(
	std::string_view video_id, std::string_view quality, std::int64_t index,
	std::int64_t expires, std::string_view signature
) const
{
	auto expected = hmac_sha256(m_secret, grant_message(video_id, quality, index, expires));

	// always compare, so the time taken does not depend on the expiry
	auto provided = hex_to_bytes(signature);
	auto match = provided && constant_time_equal(provided->data(), provided->size(), expected.data(), expected.size());

	if (now() > expires)
		return Error::grant_expired;
	else if (!match)
		return Error::signature_mismatch;
	else
		return {};
}

} // end of namespace cot
