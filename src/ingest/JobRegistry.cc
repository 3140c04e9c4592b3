/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "JobRegistry.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <algorithm>

namespace cot {

JobRegistry::JobRegistry(JobStore& store, Clock clock) :
	m_store{store},
	m_clock{clock ? std::move(clock) : Clock{[]{return std::chrono::system_clock::now();}}}
{
}

Timestamp JobRegistry::now() const
{
	return Timestamp::from(m_clock());
}

Job JobRegistry::create(const std::string& job_id, const std::string& video_id, const JobUpdate& seed)
{
	Job job;
	job.id          = job_id;
	job.video_id    = video_id;
	job.status      = JobStatus::initializing;
	job.stage       = seed.stage.value_or("Initializing");
	job.source      = seed.source.value_or("");
	job.title       = seed.title.value_or("");
	job.progress    = 0;
	job.started_at  = now();
	job.updated_at  = job.started_at;

	m_store.put(job);
	Log(LOG_INFO, "job %1% created for video %2%", job_id, video_id);
	return job;
}

std::error_code JobRegistry::update(const std::string& job_id, const JobUpdate& update)
{
	std::error_code result;
	auto found = m_store.modify(job_id, [&update, &result, this](Job& job)
	{
		if (is_terminal(job.status))
		{
			result = Error::job_terminal;
			return;
		}

		auto status = update.status.value_or(job.status);
		if (rank(status) < rank(job.status))
		{
			result = Error::invalid_transition;
			return;
		}

		if (status != job.status)
			Log(LOG_INFO, "job %1%: %2% -> %3%", job.id, to_string(job.status), to_string(status));

		job.status      = status;
		job.updated_at  = now();

		if (update.stage)           job.stage           = *update.stage;
		if (update.title)           job.title           = *update.title;
		if (update.source)          job.source          = *update.source;
		if (update.stage_progress)  job.stage_progress  = std::clamp(*update.stage_progress, 0.0, 100.0);
		if (update.current_quality) job.current_quality = *update.current_quality;
		if (update.downloaded)      job.downloaded      = *update.downloaded;
		if (update.total)           job.total           = *update.total;

		if (update.progress && !is_terminal(status))
			job.progress = std::max(job.progress, std::clamp(*update.progress, 0.0, 100.0));

		if (status == JobStatus::completed)
		{
			job.progress        = 100;
			job.stage_progress  = 100;
			job.completed_at    = job.updated_at;
			job.result          = update.result.value_or(nlohmann::json::object());
		}
		else if (status == JobStatus::failed)
		{
			job.failed_at   = job.updated_at;
			job.error       = update.error.value_or("Unknown error");
		}
	});

	return found ? result : Error::job_not_found;
}

std::optional<Job> JobRegistry::get(const std::string& job_id) const
{
	return m_store.get(job_id);
}

std::vector<Job> JobRegistry::list(std::size_t limit) const
{
	auto jobs = m_store.list();
	std::sort(jobs.begin(), jobs.end(), [](auto& a, auto& b)
	{
		return a.started_at != b.started_at ? a.started_at > b.started_at : a.id < b.id;
	});

	if (jobs.size() > limit)
		jobs.resize(limit);
	return jobs;
}

bool JobRegistry::erase(const std::string& job_id)
{
	return m_store.erase(job_id);
}

} // end of namespace cot
