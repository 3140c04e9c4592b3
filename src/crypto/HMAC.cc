/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "HMAC.hh"

#include "util/Exception.hh"

#include <boost/exception/info.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>

namespace cot {

SHA256Digest hmac_sha256(std::string_view key, std::string_view message)
{
	SHA256Digest result{};
	unsigned size = result.size();
	if (!::HMAC(
		::EVP_sha256(),
		key.data(), static_cast<int>(key.size()),
		reinterpret_cast<const unsigned char*>(message.data()), message.size(),
		result.data(), &size
	))
		BOOST_THROW_EXCEPTION(SystemError() << Message{"HMAC-SHA256 failed"});

	return result;
}

bool constant_time_equal(const void *lhs, std::size_t lhs_size, const void *rhs, std::size_t rhs_size)
{
	return lhs_size == rhs_size && ::CRYPTO_memcmp(lhs, rhs, lhs_size) == 0;
}

std::string base64url_encode(const void *data, std::size_t size)
{
	std::string result(4 * ((size + 2) / 3) + 1, '\0');
	auto len = ::EVP_EncodeBlock(
		reinterpret_cast<unsigned char*>(&result[0]),
		static_cast<const unsigned char*>(data),
		static_cast<int>(size)
	);
	result.resize(static_cast<std::size_t>(len));

	while (!result.empty() && result.back() == '=')
		result.pop_back();
	std::replace(result.begin(), result.end(), '+', '-');
	std::replace(result.begin(), result.end(), '/', '_');
	return result;
}

std::optional<std::vector<unsigned char>> base64url_decode(std::string_view in)
{
	if (in.size() % 4 == 1)
		return std::nullopt;

	std::string b64{in};
	for (auto& ch : b64)
	{
		if (ch == '-')      ch = '+';
		else if (ch == '_') ch = '/';
		else if (!std::isalnum(static_cast<unsigned char>(ch)))
			return std::nullopt;
	}
	auto padding = (4 - b64.size() % 4) % 4;
	b64.append(padding, '=');

	std::vector<unsigned char> result(b64.size() / 4 * 3);
	auto len = ::EVP_DecodeBlock(result.data(), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
	if (len < 0)
		return std::nullopt;

	// EVP_DecodeBlock() counts the padding as zero bytes
	result.resize(static_cast<std::size_t>(len) - padding);
	return result;
}

} // end of namespace cot
