/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "delivery/ByteRange.hh"

using namespace cot;

TEST_CASE("parse byte ranges", "[normal]")
{
	REQUIRE(parse_byte_range("bytes=0-99", 1000) == ByteRange{0, 99, 100});
	REQUIRE(parse_byte_range("bytes=100-", 1000) == ByteRange{100, 999, 900});
	REQUIRE(parse_byte_range("bytes=-99", 1000) == ByteRange{0, 99, 100});
	REQUIRE(parse_byte_range("bytes=999-999", 1000) == ByteRange{999, 999, 1});
	REQUIRE(parse_byte_range("bytes=0-", 1) == ByteRange{0, 0, 1});

	REQUIRE(ByteRange{100, 199, 100}.content_range(1000) == "bytes 100-199/1000");
}

TEST_CASE("unusable byte ranges serve the whole entity", "[error]")
{
	REQUIRE_FALSE(parse_byte_range(std::nullopt, 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=0-99", 0));
	REQUIRE_FALSE(parse_byte_range("items=0-99", 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=abc", 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=200-100", 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=1000-", 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=0-1000", 1000));
	REQUIRE_FALSE(parse_byte_range("bytes=99999999999999999999-", 1000));
}
