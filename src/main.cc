/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "crypto/BearerToken.hh"
#include "crypto/Random.hh"
#include "ingest/FFmpeg.hh"
#include "ingest/Transcoder.hh"
#include "server/Server.hh"
#include "storage/MetadataStore.hh"
#include "storage/StorageLocator.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/info.hpp>

#include <openssl/evp.h>

#include <iostream>
#include <cstdlib>

namespace cot {

void issue_token(const Configuration& cfg, const std::string& user)
{
	BearerToken tokens{cfg.secret(), cfg.token_expiry()};
	std::cout << tokens.issue({
		{"userId",      user},
		{"permissions", {"read", "write"}},
		{"type",        "access"}
	}) << std::endl;
}

void transcode(const Configuration& cfg, const boost::filesystem::path& input, std::string video_id)
{
	if (video_id.empty())
		video_id = random_uuid();
	StorageLocator::validate_id(video_id);

	StorageLocator locator{cfg.storage_path()};
	MetadataStore  store{locator};
	FFmpeg         ffmpeg{cfg.ffmpeg(), cfg.ffprobe()};
	Transcoder     transcoder{ffmpeg, ffmpeg, store, cfg.qualities(), cfg.chunk_duration()};

	TranscodeOptions options;
	options.qualities = cfg.default_ingest_qualities();

	auto meta = transcoder.transcode(input, video_id, options, [](const ProgressEvent& event)
	{
		Log(LOG_INFO, "%1%: %2%%%", event.stage, static_cast<int>(event.overall));
	});

	Log(LOG_NOTICE, "video %1% transcoded: %2% chunks of %3% qualities", video_id, meta.total_chunks, meta.qualities.size());
	std::cout << video_id << std::endl;
}

int StartServer(const Configuration& cfg)
{
	Server server{cfg};
	server.listen();

	Log(LOG_NOTICE, "chunky_otter (version %1%) starting", constants::version);
	server.run();
	Log(LOG_NOTICE, "chunky_otter stopped");
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace cot;
	try
	{
		OpenSSL_add_all_digests();

		Configuration cfg{argc, argv, ::getenv("CHUNKY_OTTER_CONFIG")};
		OpenLog("chunky_otter", cfg.log_level(), cfg.command());

		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}
		else if (cfg.issue_token([&cfg](auto&& user){issue_token(cfg, user);}))
			return EXIT_SUCCESS;

		else if (cfg.transcode([&cfg](auto&& input, auto&& video_id){transcode(cfg, input, video_id);}))
			return EXIT_SUCCESS;

		return StartServer(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
}
