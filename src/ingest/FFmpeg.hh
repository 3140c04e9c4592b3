/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "MediaTools.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cot {

/// \brief  Runs ffprobe and ffmpeg as child processes.
///
/// Every segment starts with a forced keyframe so that each chunk can be
/// decoded on its own.
class FFmpeg : public MediaProber, public MediaEncoder
{
public:
	explicit FFmpeg(std::string ffmpeg = "ffmpeg", std::string ffprobe = "ffprobe");

	ProbeResult probe(const boost::filesystem::path& input) override;

	void encode(
		const EncodeRequest& request,
		const std::function<void(double)>& progress,
		const CancelToken& cancel
	) override;

	void thumbnail(const boost::filesystem::path& input, const boost::filesystem::path& output, double at) override;

	static std::vector<std::string> probe_args(const boost::filesystem::path& input);
	static std::vector<std::string> encode_args(const EncodeRequest& request);
	static std::vector<std::string> thumbnail_args(const boost::filesystem::path& input, const boost::filesystem::path& output, double at);

	static ProbeResult parse_probe(const nlohmann::json& json);

	/// Position in seconds from an "out_time_us=" or "out_time_ms=" progress line.
	static std::optional<double> parse_progress(std::string_view line);

private:
	boost::filesystem::path executable(const std::string& name) const;

private:
	std::string m_ffmpeg;
	std::string m_ffprobe;
};

} // end of namespace cot
