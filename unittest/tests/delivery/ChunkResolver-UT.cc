/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "TestStorage.hh"

#include "crypto/ChunkGrant.hh"
#include "delivery/ChunkResolver.hh"
#include "util/TimeFormat.hh"

#include <cerrno>
#include <system_error>

using namespace cot;
using namespace std::chrono_literals;

TEST_CASE("resolve chunks", "[normal]")
{
	TestStorage storage;
	storage.add_video("v1", 12, {"720p", "360p"});
	ChunkResolver subject{storage.store(), "720p"};

	auto chunk = subject.resolve("v1", "360p", 2);
	REQUIRE(chunk.video_id == "v1");
	REQUIRE(chunk.quality == "360p");
	REQUIRE(chunk.index == 2);
	REQUIRE(chunk.size == 300);
	REQUIRE(chunk.path == storage.locator().chunk_path("v1", "360p", 2));

	std::error_code ec;
	auto whole = chunk.open(std::nullopt, ec);
	REQUIRE(!ec);
	REQUIRE(whole.offset == 0);
	REQUIRE(whole.length == 300);

	auto part = chunk.open(ByteRange{10, 19, 10}, ec);
	REQUIRE(!ec);
	REQUIRE(part.offset == 10);
	REQUIRE(part.length == 10);
	REQUIRE(part.buffer().size() == 10);

	SECTION("unavailable quality falls back to the default")
	{
		REQUIRE(subject.resolve("v1", "1080p", 0).quality == "720p");
		REQUIRE(subject.resolve("v1", "", 0).quality == "720p");
	}
	SECTION("by timestamp")
	{
		REQUIRE(subject.resolve_by_timestamp("v1", "720p", 0).index == 0);
		REQUIRE(subject.resolve_by_timestamp("v1", "720p", 9.99).index == 1);
		REQUIRE(subject.resolve_by_timestamp("v1", "720p", 10).index == 2);
		REQUIRE_THROWS_AS(subject.resolve_by_timestamp("v1", "720p", 15), ChunkOutOfRange);
		REQUIRE_THROWS_AS(subject.resolve_by_timestamp("v1", "720p", -1), ValidationError);

		// far beyond the end, and beyond what an index can hold
		REQUIRE_THROWS_AS(subject.resolve_by_timestamp("v1", "720p", parse_timestamp("1e30")), ChunkOutOfRange);
		REQUIRE_THROWS_AS(subject.resolve_by_timestamp("v1", "720p", 1e300), ChunkOutOfRange);
	}
}

TEST_CASE("chunk resolution failures", "[error]")
{
	TestStorage storage;
	storage.add_video("v1", 12, {"360p"});
	ChunkResolver subject{storage.store(), "720p"};

	REQUIRE_THROWS_AS(subject.resolve("nope", "360p", 0), VideoNotFound);
	REQUIRE_THROWS_AS(subject.resolve("..", "360p", 0), VideoNotFound);
	REQUIRE_THROWS_AS(subject.resolve("v1", "360p", 3), ChunkOutOfRange);
	REQUIRE_THROWS_AS(subject.resolve("v1", "360p", -1), ChunkOutOfRange);

	// default quality is not available either
	REQUIRE_THROWS_AS(subject.resolve("v1", "1080p", 0), QualityUnavailable);

	boost::filesystem::remove(storage.locator().chunk_path("v1", "360p", 1));
	REQUIRE_THROWS_AS(subject.resolve("v1", "360p", 1), ChunkFileNotFound);

	SECTION("replaced chunk file")
	{
		auto chunk = subject.resolve("v1", "360p", 0);
		TestStorage::write_file(chunk.path, "short");

		std::error_code ec;
		chunk.open(std::nullopt, ec);
		REQUIRE(ec == std::error_condition(ESTALE, std::generic_category()));
	}
}

TEST_CASE("chunk range skips missing chunks", "[normal]")
{
	TestStorage storage;
	storage.add_video("v1", 22, {"720p"});
	ChunkResolver subject{storage.store(), "720p"};

	boost::filesystem::remove(storage.locator().chunk_path("v1", "720p", 2));

	auto range = subject.chunk_range("v1", "720p", 1, 10);
	REQUIRE(range.size() == 3);
	REQUIRE(range[0].index == 1);
	REQUIRE(range[0].size == 200);
	REQUIRE(range[0].timestamp == 5);
	REQUIRE(range[1].index == 3);
	REQUIRE(range[2].index == 4);

	nlohmann::json json = range[0];
	REQUIRE(json == nlohmann::json{{"index", 1}, {"size", 200}, {"timestamp", 5.0}});

	REQUIRE_THROWS_AS(subject.chunk_range("nope", "720p", 0, 5), VideoNotFound);
}

TEST_CASE("manifest", "[normal]")
{
	TestStorage storage;
	storage.add_video("v1", 12, {"720p", "360p"});
	ChunkResolver subject{storage.store(), "720p"};

	auto manifest = subject.manifest("v1", "360p", nullptr, 1h);
	REQUIRE(manifest.quality == "360p");
	REQUIRE(manifest.available == std::vector<std::string>{"720p", "360p"});
	REQUIRE(manifest.total_chunks == 3);
	REQUIRE(manifest.chunks.size() == 3);
	REQUIRE(manifest.chunks[1].start_time == 5);
	REQUIRE(manifest.chunks[1].duration == 5);
	REQUIRE(manifest.chunks[2].duration == Approx(2));
	REQUIRE(manifest.chunks[2].url == "/api/chunks/v1/360p/2");

	nlohmann::json json = manifest;
	REQUIRE(json["videoId"] == "v1");
	REQUIRE(json["totalDuration"] == 12.0);
	REQUIRE(json["chunks"][0]["startTime"] == 0.0);

	SECTION("signed manifest")
	{
		ChunkGrant grants{"secret"};
		auto signed_manifest = subject.manifest("v1", "unknown", &grants, 1h);
		REQUIRE(signed_manifest.quality == "720p");

		auto url = signed_manifest.chunks[0].url;
		REQUIRE(url.find("/api/chunks/v1/720p/0?expires=") == 0);
		REQUIRE(url.find("&signature=") != std::string::npos);
	}
}
