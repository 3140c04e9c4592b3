/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "ChunkGrant.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <system_error>

namespace cot {

/// \brief  Expiring signed-claims tokens for the management endpoints.
///
/// The token is a compact HS256 JWS: base64url(header).base64url(claims).base64url(mac).
/// "iat" and "exp" are added to the claims when the token is issued.
class BearerToken
{
public:
	BearerToken(std::string secret, std::chrono::seconds ttl, Clock clock = {});

	std::string issue(nlohmann::json claims) const;

	/// Returns the claims, or null with Error::invalid_token or Error::token_expired.
	nlohmann::json verify(std::string_view token, std::error_code& ec) const;

	std::chrono::seconds ttl() const {return m_ttl;}

private:
	std::string m_secret;
	std::chrono::seconds m_ttl;
	Clock m_clock;
};

} // end of namespace cot
