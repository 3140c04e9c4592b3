/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "IngestService.hh"

#include "crypto/Random.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/info.hpp>
#include <boost/filesystem/path.hpp>

#include <algorithm>

namespace cot {

namespace {

// Weight of the download stage in the overall progress of remote jobs
const double download_share = 20.0;

}

IngestService::IngestService(
	JobRegistry& jobs,
	Transcoder& transcoder,
	RemoteFetcher& fetcher,
	boost::filesystem::path temp_dir,
	std::vector<std::string> default_qualities,
	std::size_t threads
) :
	m_jobs{jobs}, m_transcoder{transcoder}, m_fetcher{fetcher},
	m_temp_dir{std::move(temp_dir)}, m_default_qualities{std::move(default_qualities)},
	m_pool{std::max<std::size_t>(threads, 1)}
{
}

IngestService::~IngestService()
{
	// running jobs are stopped at the next progress report
	{
		std::unique_lock lock{m_mutex};
		for (auto& token : m_tokens)
			token.second.cancel();
	}
	m_pool.join();
}

void IngestService::join()
{
	m_pool.join();
}

template <typename Func>
void IngestService::drive(const std::string& job_id, const CancelToken& cancel, Func&& func)
{
	try
	{
		cancel.check();
		func();
	}
	catch (Cancelled&)
	{
		Log(LOG_NOTICE, "job %1% cancelled", job_id);
	}
	catch (std::exception& e)
	{
		Log(LOG_WARNING, "job %1% failed: %2%", job_id, boost::diagnostic_information(e));

		JobUpdate failed;
		failed.status = JobStatus::failed;
		failed.error  = message_of(e);
		update(job_id, failed);
	}
	remove_token(job_id);
}

Submission IngestService::submit_upload(TempFile&& source, const std::string& filename, const IngestOptions& options)
{
	Submission sub{random_uuid(), random_uuid()};

	JobUpdate seed;
	seed.source = filename;
	seed.title  = options.title.empty() ? boost::filesystem::path{filename}.stem().string() : options.title;
	m_jobs.create(sub.job_id, sub.video_id, seed);

	auto opts  = options;
	opts.title = *seed.title;
	auto token = add_token(sub.job_id);

	// asio handlers must be copyable
	auto file = std::make_shared<TempFile>(std::move(source));
	boost::asio::post(m_pool, [this, sub, file, opts, token]
	{
		drive(sub.job_id, token, [&]{run_upload(sub.job_id, sub.video_id, *file, opts, token);});
		file->discard();
	});
	return sub;
}

Submission IngestService::submit_url(std::string_view url, const IngestOptions& options)
{
	auto parsed = validate_source_url(url);
	Submission sub{random_uuid(), random_uuid()};

	JobUpdate seed;
	seed.source = parsed.str();
	seed.title  = options.title.empty() ? title_from_url(parsed) : options.title;
	m_jobs.create(sub.job_id, sub.video_id, seed);

	auto opts  = options;
	opts.title = *seed.title;
	auto token = add_token(sub.job_id);
	boost::asio::post(m_pool, [this, sub, parsed, opts, token]
	{
		drive(sub.job_id, token, [&]{run_remote(sub.job_id, sub.video_id, parsed, opts, token);});
	});
	return sub;
}

bool IngestService::cancel(const std::string& job_id)
{
	{
		std::unique_lock lock{m_mutex};
		if (auto it = m_tokens.find(job_id); it != m_tokens.end())
			it->second.cancel();
	}
	return m_jobs.erase(job_id);
}

void IngestService::run_upload(
	const std::string& job_id,
	const std::string& video_id,
	TempFile& source,
	const IngestOptions& options,
	const CancelToken& cancel
)
{
	JobUpdate processing;
	processing.status   = JobStatus::processing;
	processing.stage    = "Transcoding video";
	processing.progress = 0;
	update(job_id, processing);

	auto meta = m_transcoder.transcode(
		source.path(), video_id,
		transcode_options(options),
		[this, &job_id](const ProgressEvent& event)
		{
			JobUpdate up;
			up.stage            = event.stage;
			up.current_quality  = event.quality;
			up.stage_progress   = event.tier_progress;
			up.progress         = event.overall;
			update(job_id, up);
		},
		cancel
	);
	source.discard();

	complete(job_id, video_id, meta);
}

void IngestService::run_remote(
	const std::string& job_id,
	const std::string& video_id,
	const URL& url,
	const IngestOptions& options,
	const CancelToken& cancel
)
{
	JobUpdate downloading;
	downloading.status   = JobStatus::downloading;
	downloading.stage    = "Downloading video";
	downloading.progress = 0;
	update(job_id, downloading);

	boost::system::error_code ec;
	TempFile source;
	source.open(m_temp_dir, "download", ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode{ec}
			<< Message{"Cannot create temporary file for download"}
			<< VideoID{video_id}
		);

	Log(LOG_INFO, "job %1% downloading %2%", job_id, url.str());
	m_fetcher.fetch(url, source, [this, &job_id](const DownloadProgress& progress)
	{
		JobUpdate up;
		up.stage_progress   = progress.percent;
		up.progress         = progress.percent * download_share / 100.0;
		up.downloaded       = progress.downloaded;
		up.total            = progress.total;
		update(job_id, up);
	}, cancel);

	source.close(ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode{ec}
			<< Message{"Cannot write downloaded file"}
			<< VideoID{video_id}
		);

	cancel.check();

	JobUpdate processing;
	processing.status         = JobStatus::processing;
	processing.stage          = "Transcoding video";
	processing.stage_progress = 0;
	processing.progress       = download_share;
	update(job_id, processing);

	m_transcoder.transcode(
		source.path(), video_id,
		transcode_options(options),
		[this, &job_id](const ProgressEvent& event)
		{
			JobUpdate up;
			up.stage            = event.stage;
			up.current_quality  = event.quality;
			up.stage_progress   = event.tier_progress;
			up.progress         = download_share + event.overall * (100.0 - download_share) / 100.0;
			update(job_id, up);
		},
		cancel
	);
	source.discard();

	auto meta = m_transcoder.update_metadata(video_id, {
		{"sourceUrl",   url.str()},
		{"sourceTitle", title_from_url(url)}
	});
	complete(job_id, video_id, meta);
}

void IngestService::update(const std::string& job_id, const JobUpdate& update)
{
	if (auto ec = m_jobs.update(job_id, update))
		Log(LOG_DEBUG, "job %1% update ignored: %2%", job_id, ec.message());
}

void IngestService::complete(const std::string& job_id, const std::string& video_id, const VideoMeta& meta)
{
	JobUpdate completed;
	completed.status    = JobStatus::completed;
	completed.stage     = "Completed";
	completed.result    = result_of(video_id, meta);
	update(job_id, completed);

	Log(LOG_NOTICE, "job %1% completed: video %2% has %3% chunks", job_id, video_id, meta.total_chunks);
}

nlohmann::json IngestService::result_of(const std::string& video_id, const VideoMeta& meta)
{
	nlohmann::json result = meta;
	result["videoId"]     = video_id;
	result["streamUrl"]   = "/api/videos/" + video_id;
	result["manifestUrl"] = "/api/videos/" + video_id + "/manifest";
	return result;
}

TranscodeOptions IngestService::transcode_options(const IngestOptions& options) const
{
	TranscodeOptions result;
	result.title        = options.title;
	result.description  = options.description;
	result.qualities    = options.qualities.empty() ? m_default_qualities : options.qualities;
	return result;
}

CancelToken IngestService::add_token(const std::string& job_id)
{
	CancelToken token;
	std::unique_lock lock{m_mutex};
	m_tokens.emplace(job_id, token);
	return token;
}

void IngestService::remove_token(const std::string& job_id)
{
	std::unique_lock lock{m_mutex};
	m_tokens.erase(job_id);
}

} // end of namespace cot
