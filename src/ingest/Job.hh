/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cot {

enum class JobStatus
{
	initializing,
	downloading,
	processing,
	completed,
	failed
};

std::string_view to_string(JobStatus status);
bool is_terminal(JobStatus status);

// Position in the forward only lifecycle. Both terminal states share one rank.
int rank(JobStatus status);

/// One ingestion run.
struct Job
{
	std::string     id;
	std::string     video_id;
	JobStatus       status{JobStatus::initializing};
	double          progress{};         //!< 0-100 for the whole job
	double          stage_progress{};   //!< 0-100 within the current stage
	std::string     stage;
	std::string     source;             //!< URL or original file name
	std::string     title;

	Timestamp                   started_at;
	Timestamp                   updated_at;
	std::optional<Timestamp>    completed_at;
	std::optional<Timestamp>    failed_at;

	std::optional<std::string>      current_quality;
	std::optional<std::uint64_t>    downloaded;
	std::optional<std::uint64_t>    total;

	std::optional<std::string>      error;      //!< only when failed
	std::optional<nlohmann::json>   result;     //!< only when completed
};

/// Fields to merge into a job. Empty fields are left unchanged.
struct JobUpdate
{
	std::optional<JobStatus>        status;
	std::optional<double>           progress;
	std::optional<double>           stage_progress;
	std::optional<std::string>      stage;
	std::optional<std::string>      source;
	std::optional<std::string>      title;
	std::optional<std::string>      current_quality;
	std::optional<std::uint64_t>    downloaded;
	std::optional<std::uint64_t>    total;
	std::optional<std::string>      error;
	std::optional<nlohmann::json>   result;
};

void to_json(nlohmann::json& json, JobStatus status);
void to_json(nlohmann::json& json, const Job& job);

} // end of namespace cot
