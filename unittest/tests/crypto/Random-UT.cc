/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "crypto/Random.hh"
#include "storage/StorageLocator.hh"

#include <set>

using namespace cot;

TEST_CASE("Test random number", "[normal]")
{
	auto rand = secure_random_array<std::uint64_t, 2>();
	REQUIRE_NOTHROW(rand[0] > 0 && rand[1] > 0);
}

TEST_CASE("random UUIDs are version 4", "[normal]")
{
	std::set<std::string> seen;
	for (int i = 0; i < 100; ++i)
	{
		auto uuid = random_uuid();
		INFO(uuid);
		REQUIRE(uuid.size() == 36);
		REQUIRE(uuid[8] == '-');
		REQUIRE(uuid[13] == '-');
		REQUIRE(uuid[14] == '4');
		REQUIRE(uuid[18] == '-');
		REQUIRE(std::string{"89ab"}.find(uuid[19]) != std::string::npos);
		REQUIRE(uuid[23] == '-');

		// usable as a video ID
		REQUIRE_NOTHROW(StorageLocator::validate_id(uuid));
		seen.insert(uuid);
	}
	REQUIRE(seen.size() == 100);
}
