/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <boost/filesystem/path.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cot {

/// \brief  Maps video IDs, qualities and chunk indices to paths in the storage.
///
/// \code
/// {root}/{videoId}/metadata.json
/// {root}/{videoId}/thumbnail.jpg
/// {root}/{videoId}/chunks/{quality}/chunk_{index:06d}.ts
/// {root}/{videoId}/.staging/{quality}/
/// \endcode
///
/// Every function that takes a video ID or quality throws ValidationError if
/// it would address something outside of the video directory.
class StorageLocator
{
public:
	explicit StorageLocator(boost::filesystem::path root);

	const boost::filesystem::path& root() const {return m_root;}

	boost::filesystem::path video_dir(std::string_view video_id) const;
	boost::filesystem::path metadata_path(std::string_view video_id) const;
	boost::filesystem::path thumbnail_path(std::string_view video_id) const;
	boost::filesystem::path quality_dir(std::string_view video_id, std::string_view quality) const;
	boost::filesystem::path staging_dir(std::string_view video_id, std::string_view quality) const;
	boost::filesystem::path chunk_path(std::string_view video_id, std::string_view quality, std::int64_t index) const;

	static std::string chunk_filename(std::int64_t index);
	static std::optional<std::int64_t> parse_chunk_filename(std::string_view filename);

	static bool is_valid_id(std::string_view id);
	static void validate_id(std::string_view id);

private:
	boost::filesystem::path m_root;
};

} // end of namespace cot
