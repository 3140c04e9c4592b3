/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "ChunkResolver.hh"

#include "crypto/ChunkGrant.hh"
#include "util/Log.hh"
#include "util/TimeFormat.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace cot {

MMapView ChunkDescriptor::open(const std::optional<ByteRange>& range, std::error_code& ec) const
{
	MMapView view{MMap::open(path, ec)};
	if (ec)
		return view;

	// the file is immutable once published, so a different size means it was replaced
	if (view.file.size() != size)
	{
		ec.assign(ESTALE, std::generic_category());
		return view;
	}

	view.offset = range ? static_cast<std::size_t>(range->start)  : 0;
	view.length = range ? static_cast<std::size_t>(range->length) : view.file.size();
	return view;
}

void to_json(nlohmann::json& json, const ChunkSummary& summary)
{
	json = nlohmann::json{
		{"index",     summary.index},
		{"size",      summary.size},
		{"timestamp", summary.timestamp}
	};
}

void to_json(nlohmann::json& json, const ManifestEntry& entry)
{
	json = nlohmann::json{
		{"index",     entry.index},
		{"startTime", entry.start_time},
		{"duration",  entry.duration},
		{"url",       entry.url}
	};
}

void to_json(nlohmann::json& json, const Manifest& manifest)
{
	json = nlohmann::json{
		{"videoId",            manifest.video_id},
		{"quality",            manifest.quality},
		{"availableQualities", manifest.available},
		{"totalDuration",      manifest.total_duration},
		{"chunkDuration",      manifest.chunk_duration},
		{"totalChunks",        manifest.total_chunks},
		{"chunks",             manifest.chunks}
	};
}

std::string chunk_url(std::string_view video_id, std::string_view quality, std::int64_t index)
{
	std::string url{"/api/chunks/"};
	url.append(video_id);
	url.push_back('/');
	url.append(quality);
	url.push_back('/');
	url.append(std::to_string(index));
	return url;
}

ChunkResolver::ChunkResolver(MetadataStore& store, std::string default_quality) :
	m_store{store}, m_default_quality{std::move(default_quality)}
{
}

VideoMeta ChunkResolver::metadata(const std::string& video_id) const
{
	if (!StorageLocator::is_valid_id(video_id) || !m_store.exists(video_id))
		BOOST_THROW_EXCEPTION(VideoNotFound() << Message{"Video not found"} << VideoID{video_id});

	return m_store.load(video_id);
}

std::string ChunkResolver::resolve_quality(const VideoMeta& meta, std::string_view requested) const
{
	if (!requested.empty() && meta.has_quality(requested))
		return std::string{requested};

	if (!meta.has_quality(m_default_quality))
		BOOST_THROW_EXCEPTION(QualityUnavailable()
			<< Message{"Quality not available"}
			<< RequestedQuality{std::string{requested}}
			<< AvailableQualities{meta.qualities}
		);

	return m_default_quality;
}

ChunkDescriptor ChunkResolver::resolve(const std::string& video_id, std::string_view quality, std::int64_t index) const
{
	return resolve(video_id, metadata(video_id), quality, index);
}

ChunkDescriptor ChunkResolver::resolve(
	const std::string& video_id, const VideoMeta& meta, std::string_view quality, std::int64_t index
) const
{
	if (index < 0 || index >= meta.total_chunks)
		BOOST_THROW_EXCEPTION(ChunkOutOfRange()
			<< Message{"Chunk not found"}
			<< VideoID{video_id}
			<< RequestedIndex{index}
			<< TotalChunks{meta.total_chunks}
		);

	ChunkDescriptor result;
	result.video_id = video_id;
	result.quality  = resolve_quality(meta, quality);
	result.index    = index;
	result.path     = m_store.locator().chunk_path(video_id, result.quality, index);

	// not encoded yet, or the encoder has not published it
	boost::system::error_code ec;
	auto size = fs::file_size(result.path, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(ChunkFileNotFound()
			<< Message{"Chunk file not found"}
			<< VideoID{video_id}
			<< RequestedIndex{index}
		);

	result.size = size;
	return result;
}

ChunkDescriptor ChunkResolver::resolve_by_timestamp(const std::string& video_id, std::string_view quality, double seconds) const
{
	auto meta = metadata(video_id);
	if (seconds < 0 || meta.chunk_duration == 0)
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"Invalid timestamp"} << VideoID{video_id});

	// compare before converting: the quotient may not fit in an index
	if (seconds / meta.chunk_duration >= static_cast<double>(meta.total_chunks))
		BOOST_THROW_EXCEPTION(ChunkOutOfRange()
			<< Message{"Chunk not found"}
			<< VideoID{video_id}
			<< TotalChunks{meta.total_chunks}
		);

	return resolve(video_id, meta, quality, timestamp_to_index(seconds, meta.chunk_duration));
}

std::vector<ChunkSummary> ChunkResolver::chunk_range(
	const std::string& video_id, std::string_view quality, std::int64_t start, std::size_t count
) const
{
	auto meta = metadata(video_id);

	std::vector<ChunkSummary> result;
	for (std::size_t i = 0; i < count; ++i)
	{
		auto index = start + static_cast<std::int64_t>(i);
		try
		{
			auto chunk = resolve(video_id, meta, quality, index);
			result.push_back({index, chunk.size, index_to_timestamp(index, meta.chunk_duration)});
		}
		catch (Exception& e)
		{
			Log(LOG_WARNING, "skipping chunk %1% of video %2%: %3%", index, video_id, message_of(e));
		}
	}
	return result;
}

Manifest ChunkResolver::manifest(
	const std::string& video_id, std::string_view quality,
	const ChunkGrant *signer, std::chrono::seconds ttl
) const
{
	auto meta = metadata(video_id);

	Manifest result;
	result.video_id         = video_id;
	result.quality          = resolve_quality(meta, quality);
	result.available        = meta.qualities;
	result.total_duration   = meta.duration;
	result.chunk_duration   = meta.chunk_duration;
	result.total_chunks     = meta.total_chunks;

	for (std::int64_t i = 0; i < meta.total_chunks; ++i)
	{
		ManifestEntry entry;
		entry.index      = i;
		entry.start_time = index_to_timestamp(i, meta.chunk_duration);
		entry.duration   = (i == meta.total_chunks - 1) ?
			meta.duration - entry.start_time :
			static_cast<double>(meta.chunk_duration);
		entry.url        = chunk_url(video_id, result.quality, i);
		if (signer)
			entry.url += "?" + signer->issue(video_id, result.quality, i, ttl).query();

		result.chunks.push_back(std::move(entry));
	}
	return result;
}

} // end of namespace cot
