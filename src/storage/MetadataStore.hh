/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "StorageLocator.hh"
#include "VideoMeta.hh"

#include "util/Exception.hh"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cot {

struct VideoNotFound : virtual Exception {};
struct CorruptMetadata : virtual Exception {};

/// \brief  Reads and writes metadata.json of every video.
///
/// Writes go to a temporary file that is renamed over metadata.json, so a
/// reader sees either the old or the new descriptor. Merges on the same
/// video are serialized.
class MetadataStore
{
public:
	explicit MetadataStore(const StorageLocator& locator);

	bool exists(const std::string& video_id) const;

	/// Throws VideoNotFound or CorruptMetadata.
	VideoMeta load(const std::string& video_id) const;
	std::optional<VideoMeta> find(const std::string& video_id) const;

	void save(const std::string& video_id, const VideoMeta& meta);

	/// Read-merge-write with the top level fields in partial, stamping updatedAt.
	VideoMeta update(const std::string& video_id, const nlohmann::json& partial);

	std::vector<std::pair<std::string, VideoMeta>> list() const;

	const StorageLocator& locator() const {return m_locator;}

private:
	std::mutex& writer_lock(const std::string& video_id);
	VideoMeta read(const std::string& video_id) const;
	void write(const std::string& video_id, const VideoMeta& meta);

private:
	const StorageLocator& m_locator;

	// merges on videos hashing to the same stripe are serialized too
	std::array<std::mutex, 16> m_writers;

	struct FileStamp
	{
		std::time_t     mtime{};
		std::uintmax_t  size{};

		bool operator==(const FileStamp& rhs) const {return mtime == rhs.mtime && size == rhs.size;}
		bool operator!=(const FileStamp& rhs) const {return !(*this == rhs);}
	};
	struct CacheEntry
	{
		VideoMeta   meta;
		FileStamp   stamp;
	};
	std::optional<FileStamp> stamp(const std::string& video_id) const;

	mutable std::mutex m_cache_mutex;
	mutable std::unordered_map<std::string, CacheEntry> m_cache;
	std::uint64_t m_generation{};   //!< bumped by every write, guarded by m_cache_mutex
};

} // end of namespace cot
