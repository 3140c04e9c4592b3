/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "FFmpeg.hh"

#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/process.hpp>

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <iterator>
#include <sstream>

namespace bp = boost::process;
namespace fs = boost::filesystem;

namespace cot {
namespace {

std::string format_seconds(double sec)
{
	std::ostringstream ss;
	ss.precision(3);
	ss << std::fixed << sec;
	return ss.str();
}

bool is_progress_key(std::string_view key)
{
	return !key.empty() && std::all_of(key.begin(), key.end(), [](char c)
	{
		return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
	});
}

std::string join_lines(const std::deque<std::string>& lines)
{
	std::string result;
	for (auto&& line : lines)
	{
		if (!result.empty())
			result += "; ";
		result += line;
	}
	return result;
}

} // end of local namespace

FFmpeg::FFmpeg(std::string ffmpeg, std::string ffprobe) :
	m_ffmpeg{std::move(ffmpeg)}, m_ffprobe{std::move(ffprobe)}
{
}

fs::path FFmpeg::executable(const std::string& name) const
{
	if (name.find('/') != name.npos)
		return name;

	auto path = bp::search_path(name);
	if (path.empty())
		BOOST_THROW_EXCEPTION(SystemError() << Message{name + " not found in PATH"});
	return path;
}

std::vector<std::string> FFmpeg::probe_args(const fs::path& input)
{
	return {"-v", "error", "-print_format", "json", "-show_format", "-show_streams", input.string()};
}

std::vector<std::string> FFmpeg::encode_args(const EncodeRequest& request)
{
	auto& tier = request.tier;
	auto segment = std::to_string(request.segment_duration);
	return {
		"-hide_banner", "-nostdin", "-y",
		"-i", request.input.string(),
		"-vf", "scale=" + std::to_string(tier.width) + ":" + std::to_string(tier.height),
		"-c:v", "libx264", "-preset", "fast",
		"-b:v", tier.video_bitrate(),
		"-maxrate", tier.video_bitrate(),
		"-bufsize", std::to_string(tier.video_kbps * 2) + "k",
		"-c:a", "aac",
		"-b:a", tier.audio_bitrate(),
		"-force_key_frames", "expr:gte(t,n_forced*" + segment + ")",
		"-sc_threshold", "0",
		"-f", "segment",
		"-segment_time", segment,
		"-segment_format", "mpegts",
		"-reset_timestamps", "1",
		"-progress", "pipe:1",
		"-nostats",
		"-loglevel", "error",
		(request.output_dir / "chunk_%06d.ts").string()
	};
}

std::vector<std::string> FFmpeg::thumbnail_args(const fs::path& input, const fs::path& output, double at)
{
	return {
		"-hide_banner", "-nostdin", "-y",
		"-ss", format_seconds(at),
		"-i", input.string(),
		"-vframes", "1",
		"-vf", "scale=320:-1",
		"-loglevel", "error",
		output.string()
	};
}

ProbeResult FFmpeg::parse_probe(const nlohmann::json& json)
{
	ProbeResult result;
	try
	{
		auto duration = json.at("format").at("duration");
		result.duration = duration.is_string() ? std::strtod(duration.get<std::string>().c_str(), nullptr) : duration.get<double>();

		for (auto&& stream : json.value("streams", nlohmann::json::array()))
		{
			auto type = stream.value("codec_type", std::string{});
			if (type == "video" && result.video_codec.empty())
			{
				result.video_codec = stream.value("codec_name", std::string{"unknown"});
				result.width       = stream.value("width", 0);
				result.height      = stream.value("height", 0);
			}
			else if (type == "audio" && result.audio_codec.empty())
				result.audio_codec = stream.value("codec_name", std::string{"unknown"});
		}
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{std::string{"Invalid probe output: "} + e.what()});
	}

	if (result.video_codec.empty() || result.height <= 0)
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{"No video stream found"});
	if (!(result.duration > 0))
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{"Unknown video duration"});

	return result;
}

std::optional<double> FFmpeg::parse_progress(std::string_view line)
{
	// both keys are in microseconds
	for (std::string_view key : {"out_time_us=", "out_time_ms="})
	{
		if (line.substr(0, key.size()) == key)
		{
			std::string value{line.substr(key.size())};
			char *end{};
			auto us = std::strtoll(value.c_str(), &end, 10);
			if (end == value.c_str() || us < 0)
				return std::nullopt;
			return static_cast<double>(us) / 1'000'000.0;
		}
	}
	return std::nullopt;
}

ProbeResult FFmpeg::probe(const fs::path& input)
{
	std::string output;
	int exit_code{};
	try
	{
		bp::ipstream out;
		bp::child child{
			executable(m_ffprobe), bp::args(probe_args(input)),
			bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null
		};
		output.assign(std::istreambuf_iterator<char>{out}, std::istreambuf_iterator<char>{});
		child.wait();
		exit_code = child.exit_code();
	}
	catch (bp::process_error& e)
	{
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{std::string{"Cannot run ffprobe: "} + e.what()});
	}
	catch (SystemError& e)
	{
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{message_of(e)});
	}

	if (exit_code != 0)
		BOOST_THROW_EXCEPTION(ProbeFailure()
			<< Message{"ffprobe cannot read the video"}
			<< ExitCode{exit_code}
		);

	auto json = nlohmann::json::parse(output, nullptr, false);
	if (json.is_discarded())
		BOOST_THROW_EXCEPTION(ProbeFailure() << Message{"Invalid probe output"});

	return parse_probe(json);
}

void FFmpeg::encode(
	const EncodeRequest& request,
	const std::function<void(double)>& progress,
	const CancelToken& cancel
)
{
	std::deque<std::string> errors;
	int exit_code{};
	try
	{
		bp::ipstream out;
		bp::child child{
			executable(m_ffmpeg), bp::args(encode_args(request)),
			(bp::std_out & bp::std_err) > out, bp::std_in < bp::null
		};

		try
		{
			std::string line;
			while (std::getline(out, line))
			{
				if (cancel.cancelled())
				{
					Log(LOG_NOTICE, "terminating ffmpeg for %1% (cancelled)", request.tier.name);
					child.terminate();
					cancel.check();
				}

				if (auto pos = parse_progress(line); pos && request.source_duration > 0)
					progress(std::min(100.0, *pos / request.source_duration * 100.0));

				else if (auto eq = line.find('='); eq == line.npos || !is_progress_key(std::string_view{line}.substr(0, eq)))
				{
					// keep the last few error messages for the job record
					errors.push_back(line);
					if (errors.size() > 5)
						errors.pop_front();
				}
			}
		}
		catch (...)
		{
			if (child.running())
				child.terminate();
			throw;
		}

		child.wait();
		exit_code = child.exit_code();
	}
	catch (bp::process_error& e)
	{
		BOOST_THROW_EXCEPTION(EncodeFailure()
			<< Message{std::string{"Cannot run ffmpeg: "} + e.what()}
			<< Quality{request.tier.name}
		);
	}
	catch (SystemError& e)
	{
		BOOST_THROW_EXCEPTION(EncodeFailure() << Message{message_of(e)} << Quality{request.tier.name});
	}

	if (exit_code != 0)
		BOOST_THROW_EXCEPTION(EncodeFailure()
			<< Message{"Encoding " + request.tier.name + " failed with exit code " + std::to_string(exit_code) +
				(errors.empty() ? std::string{} : ": " + join_lines(errors))}
			<< Quality{request.tier.name}
			<< ExitCode{exit_code}
		);
}

void FFmpeg::thumbnail(const fs::path& input, const fs::path& output, double at)
{
	int exit_code{};
	try
	{
		bp::child child{
			executable(m_ffmpeg), bp::args(thumbnail_args(input, output, at)),
			bp::std_out > bp::null, bp::std_err > bp::null, bp::std_in < bp::null
		};
		child.wait();
		exit_code = child.exit_code();
	}
	catch (bp::process_error& e)
	{
		BOOST_THROW_EXCEPTION(EncodeFailure() << Message{std::string{"Cannot run ffmpeg: "} + e.what()});
	}
	catch (SystemError& e)
	{
		BOOST_THROW_EXCEPTION(EncodeFailure() << Message{message_of(e)});
	}

	if (exit_code != 0)
		BOOST_THROW_EXCEPTION(EncodeFailure()
			<< Message{"Thumbnail generation failed with exit code " + std::to_string(exit_code)}
			<< ExitCode{exit_code}
		);
}

} // end of namespace cot
