/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "crypto/BearerToken.hh"
#include "util/Error.hh"

#include <algorithm>

using namespace cot;
using namespace std::chrono_literals;

TEST_CASE("issue and verify bearer token", "[normal]")
{
	auto now = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}};
	BearerToken subject{"secret", 24h, [&now]{return now;}};

	auto token = subject.issue({{"userId", "sumsum"}, {"permissions", {"read", "write"}}, {"type", "access"}});
	REQUIRE(std::count(token.begin(), token.end(), '.') == 2);

	std::error_code ec;
	auto claims = subject.verify(token, ec);
	REQUIRE(!ec);
	REQUIRE(claims["userId"] == "sumsum");
	REQUIRE(claims["permissions"].size() == 2);
	REQUIRE(claims["iat"] == 1700000000);
	REQUIRE(claims["exp"] == 1700000000 + 24*3600);

	SECTION("expired token")
	{
		now += 24h;
		REQUIRE(subject.verify(token, ec).is_null());
		REQUIRE(ec == Error::token_expired);
	}
	SECTION("tampered payload")
	{
		auto tampered = token;
		auto dot = tampered.find('.');
		tampered[dot + 2] = tampered[dot + 2] == 'A' ? 'B' : 'A';
		REQUIRE(subject.verify(tampered, ec).is_null());
		REQUIRE(ec == Error::invalid_token);
	}
	SECTION("other secret")
	{
		BearerToken other{"other", 24h, [&now]{return now;}};
		REQUIRE(other.verify(token, ec).is_null());
		REQUIRE(ec == Error::invalid_token);
	}
}

TEST_CASE("malformed bearer tokens", "[error]")
{
	BearerToken subject{"secret", 1h};

	std::error_code ec;
	for (auto token : {"", "abc", "a.b", "a.b.c.d", "..", "a..c"})
	{
		INFO(token);
		REQUIRE(subject.verify(token, ec).is_null());
		REQUIRE(ec == Error::invalid_token);
	}
}
