/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Job.hh"

namespace cot {

std::string_view to_string(JobStatus status)
{
	switch (status)
	{
		case JobStatus::initializing:   return "initializing";
		case JobStatus::downloading:    return "downloading";
		case JobStatus::processing:     return "processing";
		case JobStatus::completed:      return "completed";
		case JobStatus::failed:         return "failed";
	}
	return "unknown";
}

bool is_terminal(JobStatus status)
{
	return status == JobStatus::completed || status == JobStatus::failed;
}

int rank(JobStatus status)
{
	switch (status)
	{
		case JobStatus::initializing:   return 0;
		case JobStatus::downloading:    return 1;
		case JobStatus::processing:     return 2;
		default:                        return 3;
	}
}

void to_json(nlohmann::json& json, JobStatus status)
{
	json = std::string{to_string(status)};
}

void to_json(nlohmann::json& json, const Job& job)
{
	json = nlohmann::json{
		{"jobId",         job.id},
		{"videoId",       job.video_id},
		{"status",        job.status},
		{"progress",      job.progress},
		{"stageProgress", job.stage_progress},
		{"stage",         job.stage},
		{"source",        job.source},
		{"title",         job.title},
		{"startedAt",     job.started_at},
		{"updatedAt",     job.updated_at}
	};

	if (job.completed_at)    json["completedAt"]    = *job.completed_at;
	if (job.failed_at)       json["failedAt"]       = *job.failed_at;
	if (job.current_quality) json["currentQuality"] = *job.current_quality;
	if (job.downloaded)      json["downloaded"]     = *job.downloaded;
	if (job.total)           json["total"]          = *job.total;
	if (job.error)           json["error"]          = *job.error;
	if (job.result)          json["result"]         = *job.result;
}

} // end of namespace cot
