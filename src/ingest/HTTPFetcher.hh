/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "RemoteFetcher.hh"

#include <chrono>

namespace cot {

/// \brief  Downloads over HTTP or HTTPS using Beast.
///
/// Each call to fetch() runs its own io_context until the response body is
/// complete or the deadline expires. Redirects are followed and the whole
/// chain shares the same deadline.
class HTTPFetcher : public RemoteFetcher
{
public:
	explicit HTTPFetcher(std::chrono::seconds timeout = std::chrono::seconds{300}, std::size_t max_redirects = 5);

	void fetch(
		const URL& url,
		TempFile& dest,
		const DownloadProgressCallback& progress,
		const CancelToken& cancel
	) override;

private:
	std::chrono::seconds    m_timeout;
	std::size_t             m_max_redirects;
};

} // end of namespace cot
