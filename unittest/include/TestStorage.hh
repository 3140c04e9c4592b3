/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "storage/MetadataStore.hh"
#include "storage/StorageLocator.hh"
#include "storage/VideoMeta.hh"

#include <boost/filesystem.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace cot {

/// Temporary storage root that is removed with everything inside.
class TestStorage
{
public:
	TestStorage() : m_root{boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cot-%%%%-%%%%-%%%%")}
	{
		boost::filesystem::create_directories(m_root);
	}
	TestStorage(const TestStorage&) = delete;
	TestStorage& operator=(const TestStorage&) = delete;
	~TestStorage()
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all(m_root, ec);
	}

	const boost::filesystem::path& root() const {return m_root;}
	const StorageLocator& locator() const {return m_locator;}
	MetadataStore& store() {return m_store;}

	/// Chunk i of every quality contains (i+1)*100 bytes of 'G'.
	VideoMeta add_video(
		const std::string& video_id,
		double duration,
		const std::vector<std::string>& qualities,
		std::uint32_t chunk_duration = 5
	)
	{
		VideoMeta meta;
		meta.title          = "Video " + video_id;
		meta.description    = "test video";
		meta.duration       = duration;
		meta.chunk_duration = chunk_duration;
		meta.total_chunks   = count_chunks(duration, chunk_duration);
		meta.qualities      = qualities;
		meta.created_at     = "2023-11-14T22:13:20.000Z";
		for (auto&& q : qualities)
		{
			meta.resolutions[q] = q == "720p" ? "1280x720" : "640x360";
			meta.bitrates[q]    = q == "720p" ? "2500k" : "500k";
			for (std::int64_t i = 0; i < meta.total_chunks; ++i)
				write_file(m_locator.chunk_path(video_id, q, i), std::string(static_cast<std::size_t>((i+1)*100), 'G'));
		}
		m_store.save(video_id, meta);
		return meta;
	}

	static void write_file(const boost::filesystem::path& path, const std::string& content)
	{
		boost::filesystem::create_directories(path.parent_path());
		std::ofstream out{path.string(), std::ios::out | std::ios::trunc | std::ios::binary};
		out << content;
	}

private:
	boost::filesystem::path m_root;
	StorageLocator          m_locator{m_root};
	MetadataStore           m_store{m_locator};
};

} // end of namespace cot
