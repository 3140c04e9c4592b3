/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "TestStorage.hh"

#include "ingest/MediaTools.hh"
#include "ingest/RemoteFetcher.hh"
#include "storage/StorageLocator.hh"

#include <boost/exception/info.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace cot {

/// Reports the same probe result for every input.
class FakeProber : public MediaProber
{
public:
	ProbeResult result{12, 1280, 720, "h264", "aac"};
	bool fail{false};

	ProbeResult probe(const boost::filesystem::path&) override
	{
		if (fail)
			BOOST_THROW_EXCEPTION(ProbeFailure() << Message{"No video stream found"});
		return result;
	}
};

/// Writes ceil(duration/segment) chunk files of "tier name + index" without running ffmpeg.
class FakeEncoder : public MediaEncoder
{
public:
	std::string fail_tier;
	bool        fail_thumbnail{false};
	std::chrono::milliseconds delay{0};     //!< per segment

	std::vector<std::string> encoded() const
	{
		std::unique_lock lock{m_mutex};
		return m_encoded;
	}

	void encode(const EncodeRequest& request, const std::function<void(double)>& progress, const CancelToken& cancel) override
	{
		{
			std::unique_lock lock{m_mutex};
			m_encoded.push_back(request.tier.name);
		}
		if (request.tier.name == fail_tier)
			BOOST_THROW_EXCEPTION(EncodeFailure() << Message{"Encoding " + fail_tier + " failed with exit code 1"});

		auto count = count_chunks(request.source_duration, request.segment_duration);
		for (std::int64_t i = 0; i < count; ++i)
		{
			std::this_thread::sleep_for(delay);
			cancel.check();
			TestStorage::write_file(
				request.output_dir / StorageLocator::chunk_filename(i),
				request.tier.name + std::to_string(i)
			);
			progress(static_cast<double>(i + 1) / count * 100.0);
		}
	}

	void thumbnail(const boost::filesystem::path&, const boost::filesystem::path& output, double) override
	{
		if (fail_thumbnail)
			BOOST_THROW_EXCEPTION(EncodeFailure() << Message{"Thumbnail generation failed with exit code 1"});
		TestStorage::write_file(output, "JPEG");
	}

private:
	mutable std::mutex m_mutex;
	std::vector<std::string> m_encoded;
};

/// Writes a fixed body instead of downloading.
class FakeFetcher : public RemoteFetcher
{
public:
	std::string body{"fake video"};
	std::optional<DownloadReason> fail;

	void fetch(const URL& url, TempFile& dest, const DownloadProgressCallback& progress, const CancelToken& cancel) override
	{
		cancel.check();

		boost::system::error_code ec;
		if (fail)
		{
			// leave a partial download behind for the caller to clean up
			dest.write(body.data(), body.size() / 2, ec);
			BOOST_THROW_EXCEPTION(DownloadFailure()
				<< Message{*fail == DownloadReason::timeout ? "Download timed out" : "Server returned 404: Not Found"}
				<< Reason{*fail}
				<< SourceURL{url.str()}
			);
		}

		dest.write(body.data(), body.size(), ec);
		if (ec)
			BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{std::error_code(ec.value(), std::generic_category())});

		progress({body.size(), body.size(), 100.0});
	}
};

} // end of namespace cot
