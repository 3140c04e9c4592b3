/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "util/TimeFormat.hh"
#include "util/Exception.hh"

#include <catch2/catch.hpp>

#include <limits>

using namespace cot;

TEST_CASE("chunk index of a timestamp", "[normal]")
{
	REQUIRE(timestamp_to_index(0, 5) == 0);
	REQUIRE(timestamp_to_index(4.999, 5) == 0);
	REQUIRE(timestamp_to_index(5, 5) == 1);
	REQUIRE(timestamp_to_index(125, 10) == 12);
	REQUIRE(timestamp_to_index(1e30, 5) == std::numeric_limits<std::int64_t>::max());

	REQUIRE(index_to_timestamp(0, 5) == 0);
	REQUIRE(index_to_timestamp(12, 10) == 120);
}

TEST_CASE("parse time strings", "[normal]")
{
	REQUIRE(parse_time_string("45") == 45);
	REQUIRE(parse_time_string("01:30") == 90);
	REQUIRE(parse_time_string("1:02:03") == 3723);
	REQUIRE(parse_time_string("00:01.5") == 1.5);

	REQUIRE(parse_timestamp("12.5") == 12.5);
	REQUIRE(parse_timestamp("2:00") == 120);
}

TEST_CASE("malformed time strings", "[error]")
{
	REQUIRE_THROWS_AS(parse_time_string(""), ValidationError);
	REQUIRE_THROWS_AS(parse_time_string("1:2:3:4"), ValidationError);
	REQUIRE_THROWS_AS(parse_time_string("ab:cd"), ValidationError);
	REQUIRE_THROWS_AS(parse_time_string("1::2"), ValidationError);
	REQUIRE_THROWS_AS(parse_timestamp("-5"), ValidationError);
	REQUIRE_THROWS_AS(parse_timestamp("5s"), ValidationError);
	REQUIRE_THROWS_AS(parse_timestamp(" 5"), ValidationError);
}

TEST_CASE("format duration", "[normal]")
{
	REQUIRE(format_duration(0) == "00:00");
	REQUIRE(format_duration(59.9) == "00:59");
	REQUIRE(format_duration(125) == "02:05");
	REQUIRE(format_duration(3600) == "01:00:00");
	REQUIRE(format_duration(3725.4) == "01:02:05");
	REQUIRE(format_duration(-3) == "00:00");
}
