/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "JobStore.hh"

namespace cot {

void MemoryJobStore::put(const Job& job)
{
	std::unique_lock lock{m_mutex};
	m_jobs.insert_or_assign(job.id, job);
}

std::optional<Job> MemoryJobStore::get(const std::string& id) const
{
	std::unique_lock lock{m_mutex};
	auto it = m_jobs.find(id);
	return it != m_jobs.end() ? std::optional<Job>{it->second} : std::nullopt;
}

std::vector<Job> MemoryJobStore::list() const
{
	std::unique_lock lock{m_mutex};

	std::vector<Job> result;
	result.reserve(m_jobs.size());
	for (auto&& [id, job] : m_jobs)
		result.push_back(job);
	return result;
}

bool MemoryJobStore::erase(const std::string& id)
{
	std::unique_lock lock{m_mutex};
	return m_jobs.erase(id) > 0;
}

bool MemoryJobStore::modify(const std::string& id, const std::function<void(Job&)>& func)
{
	std::unique_lock lock{m_mutex};
	auto it = m_jobs.find(id);
	if (it == m_jobs.end())
		return false;

	func(it->second);
	return true;
}

} // end of namespace cot
