/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "JobRegistry.hh"
#include "MediaTools.hh"
#include "RemoteFetcher.hh"
#include "TempFile.hh"
#include "Transcoder.hh"

#include <boost/asio/thread_pool.hpp>
#include <boost/filesystem/path.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cot {

struct IngestOptions
{
	std::string title;
	std::string description;
	std::vector<std::string> qualities;     //!< empty means the configured default
};

struct Submission
{
	std::string job_id;
	std::string video_id;
};

/// \brief  Runs ingestion jobs in the background.
///
/// Every job is driven by exactly one task in the thread pool. The task owns
/// the temporary source file and reports to the JobRegistry. Errors never
/// leave the task: they become the job's error.
class IngestService
{
public:
	IngestService(
		JobRegistry& jobs,
		Transcoder& transcoder,
		RemoteFetcher& fetcher,
		boost::filesystem::path temp_dir,
		std::vector<std::string> default_qualities,
		std::size_t threads
	);
	IngestService(const IngestService&) = delete;
	IngestService& operator=(const IngestService&) = delete;
	~IngestService();

	Submission submit_upload(TempFile&& source, const std::string& filename, const IngestOptions& options);

	/// Throws ValidationError if the URL is not acceptable.
	Submission submit_url(std::string_view url, const IngestOptions& options);

	/// Remove the job record and stop the job if it is still running.
	bool cancel(const std::string& job_id);

	/// Wait for all submitted jobs to finish.
	void join();

	static nlohmann::json result_of(const std::string& video_id, const VideoMeta& meta);

private:
	void run_upload(const std::string& job_id, const std::string& video_id, TempFile& source, const IngestOptions& options, const CancelToken& cancel);
	void run_remote(const std::string& job_id, const std::string& video_id, const URL& url, const IngestOptions& options, const CancelToken& cancel);

	template <typename Func>
	void drive(const std::string& job_id, const CancelToken& cancel, Func&& func);

	void update(const std::string& job_id, const JobUpdate& update);
	void complete(const std::string& job_id, const std::string& video_id, const VideoMeta& meta);
	TranscodeOptions transcode_options(const IngestOptions& options) const;

	CancelToken add_token(const std::string& job_id);
	void remove_token(const std::string& job_id);

private:
	JobRegistry&    m_jobs;
	Transcoder&     m_transcoder;
	RemoteFetcher&  m_fetcher;
	boost::filesystem::path     m_temp_dir;
	std::vector<std::string>    m_default_qualities;

	std::mutex m_mutex;
	std::unordered_map<std::string, CancelToken> m_tokens;

	boost::asio::thread_pool m_pool;
};

} // end of namespace cot
