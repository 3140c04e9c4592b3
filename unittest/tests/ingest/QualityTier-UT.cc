/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "ingest/QualityTier.hh"

using namespace cot;

namespace {

std::vector<std::string> names(const std::vector<QualityTier>& tiers)
{
	std::vector<std::string> result;
	for (auto&& tier : tiers)
		result.push_back(tier.name);
	return result;
}

}

TEST_CASE("default quality table", "[normal]")
{
	QualityTable subject;
	REQUIRE(subject.names() == std::vector<std::string>{"1080p", "720p", "480p", "360p"});
	REQUIRE(subject.lowest().name == "360p");

	auto tier = subject.find("720p");
	REQUIRE(tier);
	REQUIRE(tier->resolution() == "1280x720");
	REQUIRE(tier->video_bitrate() == "2500k");
	REQUIRE(tier->audio_bitrate() == "128k");

	REQUIRE(subject.valid("480p"));
	REQUIRE_FALSE(subject.valid("4k"));
	REQUIRE_FALSE(subject.find(""));
}

TEST_CASE("select tiers for a source", "[normal]")
{
	QualityTable subject;

	// requested order is kept
	REQUIRE(names(subject.select({"360p", "720p"}, 1080)) == std::vector<std::string>{"360p", "720p"});

	// no upscaling
	REQUIRE(names(subject.select({"1080p", "720p", "480p"}, 720)) == std::vector<std::string>{"720p", "480p"});

	// unknown and duplicated names are dropped
	REQUIRE(names(subject.select({"720p", "4k", "720p"}, 1080)) == std::vector<std::string>{"720p"});

	// a tiny source still gets the lowest tier
	REQUIRE(names(subject.select({"1080p", "720p"}, 240)) == std::vector<std::string>{"360p"});
	REQUIRE(names(subject.select({}, 1080)) == std::vector<std::string>{"360p"});
}

TEST_CASE("add tiers", "[normal]")
{
	QualityTable subject{std::vector<QualityTier>{{"small", 320, 180, 300, 64}}};
	REQUIRE(subject.lowest().name == "small");

	subject.add({"tiny", 160, 90, 100, 32});
	REQUIRE(subject.lowest().name == "tiny");

	subject.add({"small", 426, 240, 400, 64});
	REQUIRE(subject.tiers().size() == 2);
	REQUIRE(subject.find("small")->height == 240);
}
