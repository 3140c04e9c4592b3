/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "MediaTools.hh"
#include "QualityTier.hh"

#include "storage/MetadataStore.hh"

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cot {

struct TranscodeOptions
{
	std::string title;
	std::string description;
	std::vector<std::string> qualities;     //!< requested tiers, in output order
};

struct ProgressEvent
{
	std::string stage;              //!< human readable
	std::string quality;            //!< tier being encoded, empty outside of encoding
	std::size_t tier_index{};
	std::size_t tier_count{};
	double      tier_progress{};    //!< 0-100 within the tier
	double      overall{};          //!< 0-100 for the whole transcode, never decreases
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

/// \brief  Turns one source video into chunks of every selected tier.
///
/// Tiers are encoded one after another. Segments are written to a staging
/// directory and renamed into the chunk directory once the encoder has moved
/// on to the next one. metadata.json is written only after every tier
/// succeeded.
class Transcoder
{
public:
	Transcoder(
		MediaProber& prober,
		MediaEncoder& encoder,
		MetadataStore& store,
		const QualityTable& tiers,
		std::uint32_t chunk_duration
	);

	/// Throws ProbeFailure, EncodeFailure or Cancelled.
	VideoMeta transcode(
		const boost::filesystem::path& input,
		const std::string& video_id,
		const TranscodeOptions& options,
		const ProgressSink& sink = {},
		const CancelToken& cancel = {}
	);

	VideoMeta update_metadata(const std::string& video_id, const nlohmann::json& partial);

	/// Move finished segments from staging into the chunk directory.
	/// The newest segment may still be written and is kept unless all is true.
	static std::size_t publish(const boost::filesystem::path& staging, const boost::filesystem::path& dest, bool all);

private:
	MediaProber&    m_prober;
	MediaEncoder&   m_encoder;
	MetadataStore&  m_store;
	const QualityTable& m_tiers;
	std::uint32_t   m_chunk_duration;
};

} // end of namespace cot
