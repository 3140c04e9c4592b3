/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "MediaTools.hh"
#include "TempFile.hh"

#include "util/Exception.hh"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cot {

enum class DownloadReason
{
	timeout,
	bad_status,
	bad_content_type,
	transport
};
std::string to_string(DownloadReason reason);
std::ostream& operator<<(std::ostream& os, DownloadReason reason);

struct DownloadFailure : virtual Exception {};
using Reason     = boost::error_info<struct tag_download_reason, DownloadReason>;
using HTTPStatus = boost::error_info<struct tag_http_status,     unsigned>;
using SourceURL  = boost::error_info<struct tag_source_url,      std::string>;

struct URL
{
	std::string scheme;     //!< "http" or "https"
	std::string host;       //!< without the brackets of IPv6 literals
	std::string port;
	std::string target;     //!< path and query, at least "/"

	bool https() const {return scheme == "https";}
	bool default_port() const;
	std::string host_header() const;
	std::string str() const;

	/// Resolve a Location header against this URL.
	std::optional<URL> resolve(std::string_view location) const;
};

std::optional<URL> parse_url(std::string_view url);

bool is_youtube(const URL& url);

/// Parse and check a URL submitted for ingestion. Throws ValidationError.
URL validate_source_url(std::string_view url);

/// "big_buck-bunny.mp4" becomes "Big Buck Bunny".
std::string title_from_url(const URL& url);

struct DownloadProgress
{
	std::uint64_t   downloaded{};
	std::uint64_t   total{};
	double          percent{};
};

using DownloadProgressCallback = std::function<void(const DownloadProgress&)>;

/// Downloads a remote video into a temporary file.
class RemoteFetcher
{
public:
	virtual ~RemoteFetcher() = default;

	/// Throws DownloadFailure or Cancelled. The file is discarded on failure.
	virtual void fetch(
		const URL& url,
		TempFile& dest,
		const DownloadProgressCallback& progress,
		const CancelToken& cancel
	) = 0;
};

} // end of namespace cot
