/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "BearerToken.hh"
#include "HMAC.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

namespace cot {
namespace {

std::string encode_part(const std::string& text)
{
	return base64url_encode(text.data(), text.size());
}

std::optional<nlohmann::json> decode_part(std::string_view part)
{
	auto bytes = base64url_decode(part);
	if (!bytes)
		return std::nullopt;

	auto json = nlohmann::json::parse(bytes->begin(), bytes->end(), nullptr, false);
	if (json.is_discarded() || !json.is_object())
		return std::nullopt;

	return json;
}

} // end of local namespace

BearerToken::BearerToken(std::string secret, std::chrono::seconds ttl, Clock clock) :
	m_secret{std::move(secret)},
	m_ttl{ttl},
	m_clock{clock ? std::move(clock) : Clock{[]{return std::chrono::system_clock::now();}}}
{
}

std::string BearerToken::issue(nlohmann::json claims) const
{
	using namespace std::chrono;
	auto now = duration_cast<seconds>(m_clock().time_since_epoch()).count();

	if (!claims.is_object())
		claims = nlohmann::json::object();
	claims["iat"] = now;
	claims["exp"] = now + m_ttl.count();

	auto signing_input = encode_part(R"({"alg":"HS256","typ":"JWT"})") + "." + encode_part(claims.dump());
	auto mac = hmac_sha256(m_secret, signing_input);
	return signing_input + "." + base64url_encode(mac.data(), mac.size());
}

nlohmann::json BearerToken::verify(std::string_view token, std::error_code& ec) const
{
	using namespace std::chrono;

	auto remain = token;
	auto [header, payload, signature] = tokenize<3>(remain, ".");
	if (header.empty() || payload.empty() || signature.empty() ||
		token.size() != header.size() + payload.size() + signature.size() + 2)
	{
		ec = Error::invalid_token;
		return nullptr;
	}

	auto mac      = hmac_sha256(m_secret, token.substr(0, header.size() + payload.size() + 1));
	auto provided = base64url_decode(signature);
	if (!provided || !constant_time_equal(provided->data(), provided->size(), mac.data(), mac.size()))
	{
		ec = Error::invalid_token;
		return nullptr;
	}

	auto head   = decode_part(header);
	auto claims = decode_part(payload);
	if (!head || !claims || head->value("alg", "") != "HS256")
	{
		ec = Error::invalid_token;
		return nullptr;
	}

	auto exp = claims->find("exp");
	if (exp != claims->end() && exp->is_number() &&
		duration_cast<seconds>(m_clock().time_since_epoch()).count() >= exp->get<std::int64_t>())
	{
		ec = Error::token_expired;
		return nullptr;
	}

	ec.clear();
	return std::move(*claims);
}

} // end of namespace cot
