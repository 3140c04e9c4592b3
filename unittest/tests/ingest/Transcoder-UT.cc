/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "FakeMediaTools.hh"

#include "ingest/Transcoder.hh"

#include <algorithm>

using namespace cot;
namespace fs = boost::filesystem;

TEST_CASE("transcode into every selected tier", "[normal]")
{
	TestStorage storage;
	QualityTable tiers;
	FakeProber prober;
	FakeEncoder encoder;
	Transcoder subject{prober, encoder, storage.store(), tiers, 5};

	TranscodeOptions options;
	options.title       = "Bunny";
	options.description = "otters at play";
	options.qualities   = {"1080p", "720p", "360p"};

	std::vector<ProgressEvent> events;
	auto meta = subject.transcode("/tmp/bunny.mp4", "v1", options, [&events](auto& e){events.push_back(e);});

	// the 720p source is not upscaled
	REQUIRE(encoder.encoded() == std::vector<std::string>{"720p", "360p"});
	REQUIRE(meta.qualities == std::vector<std::string>{"720p", "360p"});
	REQUIRE(meta.title == "Bunny");
	REQUIRE(meta.description == "otters at play");
	REQUIRE(meta.duration == 12);
	REQUIRE(meta.chunk_duration == 5);
	REQUIRE(meta.total_chunks == 3);
	REQUIRE(meta.resolutions["360p"] == "640x360");
	REQUIRE(meta.bitrates["720p"] == "2500k");
	REQUIRE(meta.thumbnail == "thumbnail.jpg");
	REQUIRE_FALSE(meta.created_at.empty());

	// everything is published and the staging area is gone
	auto& locator = storage.locator();
	for (auto q : {"720p", "360p"})
		for (int i = 0; i < 3; ++i)
			REQUIRE(fs::exists(locator.chunk_path("v1", q, i)));
	REQUIRE_FALSE(fs::exists(locator.video_dir("v1") / ".staging"));
	REQUIRE(fs::exists(locator.thumbnail_path("v1")));
	REQUIRE(storage.store().load("v1").total_chunks == 3);

	// progress never goes backward and ends at 100
	REQUIRE_FALSE(events.empty());
	REQUIRE(events.front().stage == "Analyzing video");
	for (std::size_t i = 1; i < events.size(); ++i)
		REQUIRE(events[i].overall >= events[i-1].overall);
	REQUIRE(events.back().overall == 100);
	REQUIRE(std::any_of(events.begin(), events.end(), [](auto& e){return e.stage == "Encoding 360p (2/2)";}));
}

TEST_CASE("title defaults to the file name", "[normal]")
{
	TestStorage storage;
	QualityTable tiers;
	FakeProber prober;
	FakeEncoder encoder;
	encoder.fail_thumbnail = true;
	Transcoder subject{prober, encoder, storage.store(), tiers, 5};

	auto meta = subject.transcode("/tmp/holiday.mov", "v2", {});
	REQUIRE(meta.title == "holiday");

	// all configured tiers the source can fill
	REQUIRE(meta.qualities == std::vector<std::string>{"720p", "480p", "360p"});

	// thumbnail failure is not fatal
	REQUIRE_FALSE(meta.thumbnail);
}

TEST_CASE("transcode failures", "[error]")
{
	TestStorage storage;
	QualityTable tiers;
	FakeProber prober;
	FakeEncoder encoder;
	Transcoder subject{prober, encoder, storage.store(), tiers, 5};

	SECTION("probe failure")
	{
		prober.fail = true;
		REQUIRE_THROWS_AS(subject.transcode("/tmp/bad.mp4", "v1", {}), ProbeFailure);
		REQUIRE(encoder.encoded().empty());
	}
	SECTION("encode failure writes no metadata")
	{
		encoder.fail_tier = "480p";
		REQUIRE_THROWS_AS(subject.transcode("/tmp/bad.mp4", "v1", {}), EncodeFailure);
		REQUIRE_FALSE(storage.store().exists("v1"));
		REQUIRE_FALSE(fs::exists(storage.locator().staging_dir("v1", "480p")));
	}
	SECTION("cancelled")
	{
		CancelToken cancel;
		cancel.cancel();
		REQUIRE_THROWS_AS(subject.transcode("/tmp/bad.mp4", "v1", {}, {}, cancel), Cancelled);
		REQUIRE(encoder.encoded().empty());
	}
	SECTION("bad video ID")
	{
		REQUIRE_THROWS_AS(subject.transcode("/tmp/bad.mp4", "../v1", {}), ValidationError);
	}
}

TEST_CASE("publish finished segments", "[normal]")
{
	TestStorage storage;
	auto staging = storage.root() / "staging";
	auto dest    = storage.root() / "dest";
	fs::create_directories(dest);

	for (int i = 0; i < 3; ++i)
		TestStorage::write_file(staging / StorageLocator::chunk_filename(i), "ts");
	TestStorage::write_file(staging / "ffmpeg.log", "log");

	// the newest segment may still be written
	REQUIRE(Transcoder::publish(staging, dest, false) == 2);
	REQUIRE(fs::exists(dest / "chunk_000001.ts"));
	REQUIRE_FALSE(fs::exists(dest / "chunk_000002.ts"));

	REQUIRE(Transcoder::publish(staging, dest, true) == 1);
	REQUIRE(fs::exists(dest / "chunk_000002.ts"));
	REQUIRE(fs::exists(staging / "ffmpeg.log"));
}
