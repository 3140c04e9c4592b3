/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/filesystem/operations.hpp>

using namespace cot;

namespace {

// Put all test data (i.e. the configuration files in this test) in the same directory as
// the source code, and use __FILE__ macro to find the test data.
const boost::filesystem::path current_src = boost::filesystem::path{__FILE__}.parent_path();

Configuration load(const char *file)
{
	auto path = (current_src / file).string();
	const char *argv[] = {"chunky_otter", "--cfg", path.c_str()};
	return Configuration{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
}

}

TEST_CASE( "--help command line parsing", "[normal]" )
{
	const char *argv[] = {"chunky_otter", "--help"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(cfg.help());
}

TEST_CASE( "Configuration without command line argument", "[error]" )
{
	REQUIRE_THROWS_AS(Configuration(0, nullptr, ""), Configuration::FileError);
}

TEST_CASE( "Load normal.json", "[normal]" )
{
	auto cfg = load("normal.json");

	REQUIRE(cfg.listen_http().address() == boost::asio::ip::make_address("127.0.0.1"));
	REQUIRE(cfg.listen_http().port() == 8080);
	REQUIRE(cfg.storage_path() == boost::filesystem::weakly_canonical(current_src / "storage"));
	REQUIRE(cfg.temp_path() == boost::filesystem::weakly_canonical("/tmp/chunky_otter"));
	REQUIRE(cfg.secret() == "0123456789abcdef");
	REQUIRE(cfg.thread_count() == 4);
	REQUIRE(cfg.job_threads() == 3);
	REQUIRE(cfg.chunk_duration() == 6);
	REQUIRE(cfg.upload_limit() == 1.5*1024*1024);

	REQUIRE(cfg.qualities().tiers().size() == 2);
	REQUIRE(cfg.qualities().find("720p")->video_kbps == 2500);
	REQUIRE(cfg.qualities().find("1080p") == nullptr);
	REQUIRE(cfg.default_quality() == "360p");
	REQUIRE(cfg.default_ingest_qualities() == std::vector<std::string>{"720p"});
	REQUIRE(cfg.allowed_types() == std::vector<std::string>{"video/mp4"});

	REQUIRE(cfg.enable_auth());
	REQUIRE(cfg.signed_url_expiry() == std::chrono::minutes{10});
	REQUIRE(cfg.token_expiry() == std::chrono::hours{2});
	REQUIRE(cfg.cache().header(true)  == "public, max-age=10, s-maxage=20, stale-while-revalidate=30, immutable");
	REQUIRE(cfg.cache().header(false) == "public, max-age=10, s-maxage=20, stale-while-revalidate=30");
	REQUIRE(cfg.download_timeout() == std::chrono::minutes{1});
	REQUIRE(cfg.job_list_limit() == 10);
	REQUIRE(cfg.log_level() == LOG_NOTICE);
	REQUIRE(cfg.ffmpeg() == "/opt/ffmpeg/bin/ffmpeg");
	REQUIRE(cfg.ffprobe() == "ffprobe");
}

TEST_CASE( "Default values", "[normal]" )
{
	auto cfg = load("defaults.json");
	REQUIRE(cfg.listen_http().port() == 3000);
	REQUIRE(cfg.chunk_duration() == 5);
	REQUIRE(cfg.upload_limit() == 1024UL*1024*1024);
	REQUIRE(cfg.qualities().names() == std::vector<std::string>{"1080p", "720p", "480p", "360p"});
	REQUIRE(cfg.default_quality() == "720p");
	REQUIRE_FALSE(cfg.enable_auth());
	REQUIRE(cfg.signed_url_expiry() == std::chrono::hours{1});
	REQUIRE(cfg.token_expiry() == std::chrono::hours{24});
	REQUIRE(cfg.cache().header(true) == "public, max-age=86400, s-maxage=604800, stale-while-revalidate=86400, immutable");
	REQUIRE(cfg.log_level() == LOG_INFO);
	REQUIRE_FALSE(cfg.command());
}

TEST_CASE( "Invalid configuration files", "[error]" )
{
	REQUIRE_THROWS_AS(load("missing_secret.json"), Configuration::Error);
	REQUIRE_THROWS_AS(load("bad_default_quality.json"), Configuration::Error);
	REQUIRE_THROWS_AS(load("zero_chunk_duration.json"), Configuration::Error);
	REQUIRE_THROWS_AS(load("bad_log_level.json"), Configuration::Error);
	REQUIRE_THROWS_AS(load("no_such_file.json"), Configuration::FileError);
}

TEST_CASE( "Commands on the command line", "[normal]" )
{
	auto path = (current_src / "defaults.json").string();
	const char *argv[] = {"chunky_otter", "--cfg", path.c_str(), "--transcode", "input.mp4", "--video-id", "abc"};
	Configuration cfg{sizeof(argv)/sizeof(argv[1]), argv, nullptr};
	REQUIRE(cfg.command());

	REQUIRE_FALSE(cfg.issue_token([](auto&&){FAIL("unexpected token command");}));

	std::string id;
	REQUIRE(cfg.transcode([&id](auto&& input, auto&& video_id)
	{
		REQUIRE(input == "input.mp4");
		id = video_id;
	}));
	REQUIRE(id == "abc");
}

TEST_CASE( "Log level names", "[normal]" )
{
	REQUIRE(ParseLogLevel("debug") == LOG_DEBUG);
	REQUIRE(ParseLogLevel("warning") == LOG_WARNING);
	REQUIRE(ParseLogLevel("crit") == LOG_CRIT);
	REQUIRE_FALSE(ParseLogLevel("WARNING"));
	REQUIRE_FALSE(ParseLogLevel(""));
}
