/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Transcoder.hh"

#include "util/Log.hh"
#include "util/Timestamp.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem.hpp>

#include <algorithm>

namespace fs = boost::filesystem;

namespace cot {

Transcoder::Transcoder(
	MediaProber& prober,
	MediaEncoder& encoder,
	MetadataStore& store,
	const QualityTable& tiers,
	std::uint32_t chunk_duration
) :
	m_prober{prober}, m_encoder{encoder}, m_store{store}, m_tiers{tiers}, m_chunk_duration{chunk_duration}
{
}

VideoMeta Transcoder::transcode(
	const fs::path& input,
	const std::string& video_id,
	const TranscodeOptions& options,
	const ProgressSink& sink,
	const CancelToken& cancel
)
{
	auto& locator = m_store.locator();
	StorageLocator::validate_id(video_id);

	auto emit = [&sink](ProgressEvent&& event)
	{
		if (sink)
			sink(event);
	};

	cancel.check();
	emit({"Analyzing video"});

	auto probe = m_prober.probe(input);
	Log(LOG_INFO, "video %1%: %2%s %3%x%4% %5%/%6%", video_id, probe.duration, probe.width, probe.height,
		probe.video_codec, probe.audio_codec.empty() ? "none" : probe.audio_codec);

	auto tiers = m_tiers.select(options.qualities.empty() ? m_tiers.names() : options.qualities, probe.height);

	double overall = 0;
	for (std::size_t i = 0; i < tiers.size(); ++i)
	{
		cancel.check();

		auto& tier   = tiers[i];
		auto staging = locator.staging_dir(video_id, tier.name);
		auto dest    = locator.quality_dir(video_id, tier.name);
		auto stage   = "Encoding " + tier.name + " (" + std::to_string(i+1) + "/" + std::to_string(tiers.size()) + ")";

		fs::remove_all(staging);
		fs::create_directories(staging);
		fs::create_directories(dest);

		Log(LOG_INFO, "video %1%: encoding %2% (%3%)", video_id, tier.name, tier.resolution());
		auto on_progress = [&, i](double tier_progress)
		{
			cancel.check();
			publish(staging, dest, false);

			overall = std::max(overall, (static_cast<double>(i) + tier_progress / 100.0) / tiers.size() * 100.0);
			emit({stage, tier.name, i, tiers.size(), tier_progress, overall});
		};

		try
		{
			m_encoder.encode({input, staging, tier, m_chunk_duration, probe.duration}, on_progress, cancel);
		}
		catch (...)
		{
			boost::system::error_code ec;
			fs::remove_all(staging, ec);
			throw;
		}

		publish(staging, dest, true);
		fs::remove_all(staging);

		overall = std::max(overall, static_cast<double>(i + 1) / tiers.size() * 100.0);
		emit({stage, tier.name, i, tiers.size(), 100.0, overall});
	}

	boost::system::error_code ec;
	fs::remove(locator.video_dir(video_id) / ".staging", ec);

	VideoMeta meta;
	meta.title          = options.title.empty() ? input.stem().string() : options.title;
	meta.description    = options.description;
	meta.duration       = probe.duration;
	meta.chunk_duration = m_chunk_duration;
	meta.total_chunks   = count_chunks(probe.duration, m_chunk_duration);
	for (auto&& tier : tiers)
	{
		meta.qualities.push_back(tier.name);
		meta.resolutions[tier.name] = tier.resolution();
		meta.bitrates[tier.name]    = tier.video_bitrate();
	}

	emit({"Generating thumbnail", {}, tiers.size(), tiers.size(), 100.0, overall});
	try
	{
		m_encoder.thumbnail(input, locator.thumbnail_path(video_id), probe.duration * 0.1);
		meta.thumbnail = locator.thumbnail_path(video_id).filename().string();
	}
	catch (EncodeFailure& e)
	{
		Log(LOG_WARNING, "video %1%: no thumbnail: %2%", video_id, message_of(e));
	}

	meta.created_at = Timestamp::now().iso8601();
	m_store.save(video_id, meta);

	Log(LOG_INFO, "video %1%: transcoded %2% chunks in %3% tiers", video_id, meta.total_chunks, tiers.size());
	return meta;
}

VideoMeta Transcoder::update_metadata(const std::string& video_id, const nlohmann::json& partial)
{
	return m_store.update(video_id, partial);
}

std::size_t Transcoder::publish(const fs::path& staging, const fs::path& dest, bool all)
{
	std::vector<std::pair<std::int64_t, fs::path>> segments;

	boost::system::error_code ec;
	for (auto&& entry : fs::directory_iterator{staging, ec})
	{
		if (auto index = StorageLocator::parse_chunk_filename(entry.path().filename().string()))
			segments.emplace_back(*index, entry.path());
	}
	std::sort(segments.begin(), segments.end());

	if (!all && !segments.empty())
		segments.pop_back();

	for (auto&& [index, path] : segments)
		fs::rename(path, dest / path.filename());

	return segments.size();
}

} // end of namespace cot
