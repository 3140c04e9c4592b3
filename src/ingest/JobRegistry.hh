/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "Job.hh"
#include "JobStore.hh"

#include "crypto/ChunkGrant.hh"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cot {

/// \brief  The job lifecycle state machine on top of a JobStore.
///
/// Status only moves forward: initializing, downloading, processing, then
/// completed or failed. Terminal jobs never change again. Progress never
/// decreases while the job is running and becomes 100 when it completes.
class JobRegistry
{
public:
	explicit JobRegistry(JobStore& store, Clock clock = {});

	Job create(const std::string& job_id, const std::string& video_id, const JobUpdate& seed = {});

	/// Returns Error::job_not_found, Error::job_terminal or Error::invalid_transition
	/// if the update is rejected. Rejected updates change nothing.
	std::error_code update(const std::string& job_id, const JobUpdate& update);

	std::optional<Job> get(const std::string& job_id) const;

	/// Most recently started jobs first.
	std::vector<Job> list(std::size_t limit) const;

	bool erase(const std::string& job_id);

private:
	Timestamp now() const;

private:
	JobStore&   m_store;
	Clock       m_clock;
};

} // end of namespace cot
