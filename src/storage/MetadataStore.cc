/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "MetadataStore.hh"

#include "util/Log.hh"
#include "util/Timestamp.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem.hpp>

#include <algorithm>
#include <cerrno>
#include <fstream>

namespace fs = boost::filesystem;

namespace cot {

MetadataStore::MetadataStore(const StorageLocator& locator) : m_locator{locator}
{
}

bool MetadataStore::exists(const std::string& video_id) const
{
	boost::system::error_code ec;
	return StorageLocator::is_valid_id(video_id) && fs::is_regular_file(m_locator.metadata_path(video_id), ec);
}

std::optional<VideoMeta> MetadataStore::find(const std::string& video_id) const
{
	if (!exists(video_id))
		return std::nullopt;

	try
	{
		return load(video_id);
	}
	catch (VideoNotFound&)
	{
		// removed between exists() and load()
		return std::nullopt;
	}
}

VideoMeta MetadataStore::load(const std::string& video_id) const
{
	auto before = stamp(video_id);
	if (!before)
		BOOST_THROW_EXCEPTION(VideoNotFound()
			<< Message{"Video not found"}
			<< VideoID{video_id}
		);

	std::uint64_t generation{};
	{
		std::unique_lock lock{m_cache_mutex};
		if (auto it = m_cache.find(video_id); it != m_cache.end() && it->second.stamp == *before)
			return it->second.meta;
		generation = m_generation;
	}

	auto meta = read(video_id);

	// cache only what is known to match the file on disk: no write from this
	// process and no visible change to the file while it was being read
	std::unique_lock lock{m_cache_mutex};
	if (generation == m_generation && stamp(video_id) == before)
		m_cache.insert_or_assign(video_id, CacheEntry{meta, *before});
	return meta;
}

std::optional<MetadataStore::FileStamp> MetadataStore::stamp(const std::string& video_id) const
{
	auto path = m_locator.metadata_path(video_id);

	boost::system::error_code ec;
	FileStamp result;
	result.mtime = fs::last_write_time(path, ec);
	if (!ec)
		result.size = fs::file_size(path, ec);

	return ec ? std::nullopt : std::optional<FileStamp>{result};
}

VideoMeta MetadataStore::read(const std::string& video_id) const
{
	auto path = m_locator.metadata_path(video_id);

	std::ifstream file{path.string()};
	if (!file)
		BOOST_THROW_EXCEPTION(VideoNotFound()
			<< Message{"Video not found"}
			<< VideoID{video_id}
			<< ErrorCode{std::error_code(errno, std::generic_category())}
		);

	try
	{
		return nlohmann::json::parse(file).get<VideoMeta>();
	}
	catch (nlohmann::json::exception& e)
	{
		Log(LOG_WARNING, "corrupted metadata for video %1%: %2%", video_id, e.what());
		BOOST_THROW_EXCEPTION(CorruptMetadata()
			<< Message{e.what()}
			<< VideoID{video_id}
		);
	}
}

void MetadataStore::save(const std::string& video_id, const VideoMeta& meta)
{
	std::unique_lock lock{writer_lock(video_id)};
	write(video_id, meta);
}

VideoMeta MetadataStore::update(const std::string& video_id, const nlohmann::json& partial)
{
	std::unique_lock lock{writer_lock(video_id)};

	nlohmann::json merged = read(video_id);
	if (partial.is_object())
		merged.update(partial);
	merged["updatedAt"] = Timestamp::now().iso8601();

	VideoMeta result;
	try
	{
		result = merged.get<VideoMeta>();
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{std::string{"Invalid metadata update: "} + e.what()}
			<< VideoID{video_id}
		);
	}

	write(video_id, result);
	return result;
}

void MetadataStore::write(const std::string& video_id, const VideoMeta& meta)
{
	auto path = m_locator.metadata_path(video_id);
	fs::create_directories(path.parent_path());

	auto tmp = path.parent_path() / fs::unique_path(".metadata-%%%%-%%%%.json");
	{
		std::ofstream file{tmp.string(), std::ios::out | std::ios::trunc};
		file << nlohmann::json(meta).dump(2);
		file.flush();
		if (!file)
		{
			boost::system::error_code ec;
			fs::remove(tmp, ec);
			BOOST_THROW_EXCEPTION(SystemError()
				<< Message{"cannot write metadata"}
				<< VideoID{video_id}
				<< ErrorCode{std::error_code(errno, std::generic_category())}
			);
		}
	}

	// readers see either the old or the new file
	fs::rename(tmp, path);

	std::unique_lock lock{m_cache_mutex};
	m_cache.erase(video_id);
	++m_generation;
}

std::vector<std::pair<std::string, VideoMeta>> MetadataStore::list() const
{
	std::vector<std::pair<std::string, VideoMeta>> result;

	boost::system::error_code ec;
	for (auto&& entry : fs::directory_iterator{m_locator.root(), ec})
	{
		auto video_id = entry.path().filename().string();
		if (!fs::is_directory(entry.status()) || !StorageLocator::is_valid_id(video_id) || video_id.front() == '.')
			continue;

		try
		{
			if (exists(video_id))
				result.emplace_back(video_id, load(video_id));
		}
		catch (Exception& e)
		{
			Log(LOG_NOTICE, "skipping video %1% in listing: %2%", video_id, message_of(e));
		}
	}
	if (ec)
		Log(LOG_WARNING, "cannot list storage %1%: %2%", m_locator.root(), ec.message());

	std::sort(result.begin(), result.end(), [](auto& a, auto& b){return a.first < b.first;});
	return result;
}

std::mutex& MetadataStore::writer_lock(const std::string& video_id)
{
	return m_writers[std::hash<std::string>{}(video_id) % m_writers.size()];
}

} // end of namespace cot
