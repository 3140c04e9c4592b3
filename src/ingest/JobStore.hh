/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "Job.hh"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cot {

/// Keyed storage of job records.
class JobStore
{
public:
	virtual ~JobStore() = default;

	virtual void put(const Job& job) = 0;
	virtual std::optional<Job> get(const std::string& id) const = 0;
	virtual std::vector<Job> list() const = 0;
	virtual bool erase(const std::string& id) = 0;

	/// Apply func to the record atomically. Returns false if there is no such record.
	virtual bool modify(const std::string& id, const std::function<void(Job&)>& func) = 0;
};

/// Jobs of this process only. They are lost on restart.
class MemoryJobStore : public JobStore
{
public:
	MemoryJobStore() = default;

	void put(const Job& job) override;
	std::optional<Job> get(const std::string& id) const override;
	std::vector<Job> list() const override;
	bool erase(const std::string& id) override;
	bool modify(const std::string& id, const std::function<void(Job&)>& func) override;

private:
	mutable std::mutex m_mutex;
	std::unordered_map<std::string, Job> m_jobs;
};

} // end of namespace cot
