/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "FakeMediaTools.hh"

#include "ingest/IngestService.hh"

using namespace cot;
using namespace std::chrono_literals;

namespace {

struct IngestFixture
{
	TestStorage     storage;
	QualityTable    tiers;
	FakeProber      prober;
	FakeEncoder     encoder;
	FakeFetcher     fetcher;
	MemoryJobStore  store;
	JobRegistry     jobs{store};
	Transcoder      transcoder{prober, encoder, storage.store(), tiers, 5};
	IngestService   subject{jobs, transcoder, fetcher, storage.root(), {"720p", "360p"}, 2};

	TempFile upload(const std::string& content = "fake upload")
	{
		boost::system::error_code ec;
		TempFile file;
		file.open(storage.root(), "upload", ec);
		REQUIRE(!ec);
		file.write(content.data(), content.size(), ec);
		REQUIRE(!ec);
		file.close(ec);
		REQUIRE(!ec);
		return file;
	}

	// temporary files left in the storage root
	std::size_t leftovers(const std::string& prefix) const
	{
		std::size_t count = 0;
		for (auto&& entry : boost::filesystem::directory_iterator{storage.root()})
			if (entry.path().filename().string().rfind(prefix + "-", 0) == 0)
				++count;
		return count;
	}
};

}

TEST_CASE("ingest an uploaded file", "[normal]")
{
	IngestFixture f;

	auto file = f.upload();
	auto path = file.path();

	IngestOptions options;
	options.description = "my holiday";
	auto sub = f.subject.submit_upload(std::move(file), "holiday.mp4", options);
	REQUIRE_FALSE(sub.job_id.empty());
	REQUIRE_FALSE(sub.video_id.empty());
	REQUIRE(sub.job_id != sub.video_id);

	auto created = f.jobs.get(sub.job_id);
	REQUIRE(created);
	REQUIRE(created->video_id == sub.video_id);
	REQUIRE(created->source == "holiday.mp4");
	REQUIRE(created->title == "holiday");

	f.subject.join();

	auto job = f.jobs.get(sub.job_id);
	REQUIRE(job->status == JobStatus::completed);
	REQUIRE(job->progress == 100);
	REQUIRE((*job->result)["videoId"] == sub.video_id);
	REQUIRE((*job->result)["streamUrl"] == "/api/videos/" + sub.video_id);
	REQUIRE((*job->result)["manifestUrl"] == "/api/videos/" + sub.video_id + "/manifest");
	REQUIRE((*job->result)["qualities"] == nlohmann::json{"720p", "360p"});

	auto meta = f.storage.store().load(sub.video_id);
	REQUIRE(meta.title == "holiday");
	REQUIRE(meta.description == "my holiday");

	// uploaded file is removed after the job
	REQUIRE_FALSE(boost::filesystem::exists(path));
}

TEST_CASE("ingest from a URL", "[normal]")
{
	IngestFixture f;

	IngestOptions options;
	options.qualities = {"360p"};
	auto sub = f.subject.submit_url("https://cdn.example.com/media/big_buck-bunny.mp4?token=1", options);
	REQUIRE(f.jobs.get(sub.job_id)->title == "Big Buck Bunny");
	REQUIRE(f.jobs.get(sub.job_id)->source == "https://cdn.example.com/media/big_buck-bunny.mp4?token=1");

	f.subject.join();

	auto job = f.jobs.get(sub.job_id);
	REQUIRE(job->status == JobStatus::completed);
	REQUIRE(job->downloaded == f.fetcher.body.size());

	auto meta = f.storage.store().load(sub.video_id);
	REQUIRE(meta.qualities == std::vector<std::string>{"360p"});
	REQUIRE(meta.title == "Big Buck Bunny");
	REQUIRE(meta.source_url == "https://cdn.example.com/media/big_buck-bunny.mp4?token=1");
	REQUIRE(meta.source_title == "Big Buck Bunny");
}

TEST_CASE("failed ingestion", "[error]")
{
	IngestFixture f;

	SECTION("download failure")
	{
		f.fetcher.fail = DownloadReason::timeout;
		auto sub = f.subject.submit_url("http://example.com/video.mp4", {});
		f.subject.join();

		auto job = f.jobs.get(sub.job_id);
		REQUIRE(job->status == JobStatus::failed);
		REQUIRE(job->error == "Download timed out");
		REQUIRE(job->failed_at.has_value());
		REQUIRE_FALSE(f.storage.store().exists(sub.video_id));

		// the partial download is removed
		REQUIRE(f.leftovers("download") == 0);
	}
	SECTION("encode failure")
	{
		f.encoder.fail_tier = "360p";
		auto file = f.upload();
		auto path = file.path();
		auto sub = f.subject.submit_upload(std::move(file), "movie.mp4", {});
		f.subject.join();

		auto job = f.jobs.get(sub.job_id);
		REQUIRE(job->status == JobStatus::failed);
		REQUIRE(job->error == "Encoding 360p failed with exit code 1");
		REQUIRE_FALSE(job->result);
		REQUIRE_FALSE(boost::filesystem::exists(path));
	}
	SECTION("probe failure")
	{
		f.prober.fail = true;
		auto file = f.upload();
		auto path = file.path();
		auto sub = f.subject.submit_upload(std::move(file), "movie.mp4", {});
		f.subject.join();

		auto job = f.jobs.get(sub.job_id);
		REQUIRE(job->status == JobStatus::failed);
		REQUIRE(job->error == "No video stream found");
		REQUIRE(f.encoder.encoded().empty());
		REQUIRE_FALSE(boost::filesystem::exists(path));
		REQUIRE_FALSE(f.storage.store().exists(sub.video_id));
	}
	SECTION("encode failure after a download")
	{
		f.encoder.fail_tier = "720p";
		auto sub = f.subject.submit_url("https://example.com/clip.mp4", {});
		f.subject.join();

		REQUIRE(f.jobs.get(sub.job_id)->status == JobStatus::failed);
		REQUIRE(f.leftovers("download") == 0);
	}
	SECTION("rejected URLs create no job")
	{
		REQUIRE_THROWS_AS(f.subject.submit_url("ftp://example.com/video.mp4", {}), ValidationError);
		REQUIRE_THROWS_AS(f.subject.submit_url("not a url", {}), ValidationError);
		REQUIRE_THROWS_AS(f.subject.submit_url("https://www.youtube.com/watch?v=abc", {}), ValidationError);
		REQUIRE_THROWS_AS(f.subject.submit_url("https://youtu.be/abc", {}), ValidationError);
		REQUIRE(f.jobs.list(10).empty());
	}
}

TEST_CASE("cancel a running job", "[normal]")
{
	IngestFixture f;
	f.prober.result.duration = 500;
	f.encoder.delay = 20ms;

	auto sub = f.subject.submit_upload(f.upload(), "long.mp4", {});
	for (int i = 0; i < 100 && f.encoder.encoded().empty(); ++i)
		std::this_thread::sleep_for(10ms);

	REQUIRE(f.subject.cancel(sub.job_id));
	REQUIRE_FALSE(f.jobs.get(sub.job_id));
	REQUIRE_FALSE(f.subject.cancel(sub.job_id));

	f.subject.join();
	REQUIRE_FALSE(f.jobs.get(sub.job_id));
	REQUIRE_FALSE(f.storage.store().exists(sub.video_id));
}
