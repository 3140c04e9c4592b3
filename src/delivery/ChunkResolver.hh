/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "ByteRange.hh"

#include "storage/MetadataStore.hh"
#include "util/Exception.hh"
#include "util/MMap.hh"

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cot {

class ChunkGrant;

struct ChunkOutOfRange : virtual Exception {};
struct QualityUnavailable : virtual Exception {};
struct ChunkFileNotFound : virtual Exception {};

using RequestedIndex     = boost::error_info<struct tag_requested_index,      std::int64_t>;
using TotalChunks        = boost::error_info<struct tag_total_chunks,         std::int64_t>;
using RequestedQuality   = boost::error_info<struct tag_requested_quality,    std::string>;
using AvailableQualities = boost::error_info<struct tag_available_qualities,  std::vector<std::string>>;

/// An existing chunk file.
struct ChunkDescriptor
{
	std::string             video_id;
	std::string             quality;    //!< the resolved quality, may differ from the requested one
	std::int64_t            index{};
	std::uint64_t           size{};
	boost::filesystem::path path;

	/// Map the chunk, or only the range if there is one.
	MMapView open(const std::optional<ByteRange>& range, std::error_code& ec) const;
};

struct ChunkSummary
{
	std::int64_t    index{};
	std::uint64_t   size{};
	double          timestamp{};
};
void to_json(nlohmann::json& json, const ChunkSummary& summary);

struct ManifestEntry
{
	std::int64_t    index{};
	double          start_time{};
	double          duration{};
	std::string     url;
};
void to_json(nlohmann::json& json, const ManifestEntry& entry);

struct Manifest
{
	std::string     video_id;
	std::string     quality;
	std::vector<std::string> available;
	double          total_duration{};
	std::uint32_t   chunk_duration{};
	std::int64_t    total_chunks{};
	std::vector<ManifestEntry> chunks;
};
void to_json(nlohmann::json& json, const Manifest& manifest);

std::string chunk_url(std::string_view video_id, std::string_view quality, std::int64_t index);

/// \brief  Resolves chunk addresses into existing chunk files.
///
/// An unavailable quality is silently replaced by the default quality. Only
/// when the default quality is unavailable too does resolution fail.
class ChunkResolver
{
public:
	ChunkResolver(MetadataStore& store, std::string default_quality);

	ChunkDescriptor resolve(const std::string& video_id, std::string_view quality, std::int64_t index) const;
	ChunkDescriptor resolve_by_timestamp(const std::string& video_id, std::string_view quality, double seconds) const;

	/// Summaries of the chunks in [start, start+count) that can be resolved now.
	std::vector<ChunkSummary> chunk_range(const std::string& video_id, std::string_view quality, std::int64_t start, std::size_t count) const;

	/// Every chunk of the resolved quality. Chunk URLs are signed when signer is not null.
	Manifest manifest(
		const std::string& video_id, std::string_view quality,
		const ChunkGrant *signer, std::chrono::seconds ttl
	) const;

	std::string resolve_quality(const VideoMeta& meta, std::string_view requested) const;
	const std::string& default_quality() const {return m_default_quality;}

private:
	VideoMeta metadata(const std::string& video_id) const;
	ChunkDescriptor resolve(const std::string& video_id, const VideoMeta& meta, std::string_view quality, std::int64_t index) const;

private:
	MetadataStore&  m_store;
	std::string     m_default_quality;
};

} // end of namespace cot
