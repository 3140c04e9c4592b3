/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "QualityTier.hh"

#include "util/Exception.hh"

#include <boost/filesystem/path.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cot {

struct ProbeFailure : virtual Exception {};
struct EncodeFailure : virtual Exception {};
using Quality  = boost::error_info<struct tag_quality,   std::string>;
using ExitCode = boost::error_info<struct tag_exit_code, int>;

/// Shared flag to stop a running job. Copies refer to the same flag.
class CancelToken
{
public:
	CancelToken() : m_flag{std::make_shared<std::atomic<bool>>(false)} {}

	void cancel() noexcept {m_flag->store(true);}
	bool cancelled() const noexcept {return m_flag->load();}

	// Throws Cancelled if the job was cancelled.
	void check() const;

private:
	std::shared_ptr<std::atomic<bool>> m_flag;
};

struct ProbeResult
{
	double          duration{};     //!< seconds
	int             width{};
	int             height{};
	std::string     video_codec;
	std::string     audio_codec;
};

class MediaProber
{
public:
	virtual ~MediaProber() = default;

	/// Throws ProbeFailure.
	virtual ProbeResult probe(const boost::filesystem::path& input) = 0;
};

struct EncodeRequest
{
	boost::filesystem::path input;
	boost::filesystem::path output_dir;         //!< segments are written here as chunk_%06d.ts
	QualityTier             tier;
	std::uint32_t           segment_duration{};
	double                  source_duration{};  //!< for converting the encoder position into a percentage
};

class MediaEncoder
{
public:
	virtual ~MediaEncoder() = default;

	/// Encode one tier into segments. progress receives 0-100 within this tier.
	/// Throws EncodeFailure, or Cancelled after terminating the encoder.
	virtual void encode(
		const EncodeRequest& request,
		const std::function<void(double)>& progress,
		const CancelToken& cancel
	) = 0;

	/// Throws EncodeFailure.
	virtual void thumbnail(const boost::filesystem::path& input, const boost::filesystem::path& output, double at) = 0;
};

} // end of namespace cot
