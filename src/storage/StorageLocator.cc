/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "StorageLocator.hh"

#include "util/Exception.hh"

#include <boost/exception/info.hpp>

#include <cstdio>

namespace cot {
namespace {

const std::string_view chunk_prefix{"chunk_"};
const std::string_view chunk_suffix{".ts"};

} // end of local namespace

StorageLocator::StorageLocator(boost::filesystem::path root) : m_root{std::move(root)}
{
}

bool StorageLocator::is_valid_id(std::string_view id)
{
	return !id.empty() && id != "." && id != ".." &&
		id.find_first_of(std::string_view{"/\\\0", 3}) == id.npos;
}

void StorageLocator::validate_id(std::string_view id)
{
	if (!is_valid_id(id))
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{"Invalid identifier"}
			<< BadInput{std::string{id}}
		);
}

boost::filesystem::path StorageLocator::video_dir(std::string_view video_id) const
{
	validate_id(video_id);
	return m_root / std::string{video_id};
}

boost::filesystem::path StorageLocator::metadata_path(std::string_view video_id) const
{
	return video_dir(video_id) / "metadata.json";
}

boost::filesystem::path StorageLocator::thumbnail_path(std::string_view video_id) const
{
	return video_dir(video_id) / "thumbnail.jpg";
}

boost::filesystem::path StorageLocator::quality_dir(std::string_view video_id, std::string_view quality) const
{
	validate_id(quality);
	return video_dir(video_id) / "chunks" / std::string{quality};
}

boost::filesystem::path StorageLocator::staging_dir(std::string_view video_id, std::string_view quality) const
{
	validate_id(quality);
	return video_dir(video_id) / ".staging" / std::string{quality};
}

boost::filesystem::path StorageLocator::chunk_path(std::string_view video_id, std::string_view quality, std::int64_t index) const
{
	return quality_dir(video_id, quality) / chunk_filename(index);
}

std::string StorageLocator::chunk_filename(std::int64_t index)
{
	char buf[32];
	std::snprintf(buf, sizeof(buf), "chunk_%06lld.ts", static_cast<long long>(index));
	return buf;
}

std::optional<std::int64_t> StorageLocator::parse_chunk_filename(std::string_view filename)
{
	if (filename.size() < chunk_prefix.size() + 6 + chunk_suffix.size() ||
		filename.substr(0, chunk_prefix.size()) != chunk_prefix ||
		filename.substr(filename.size() - chunk_suffix.size()) != chunk_suffix)
		return std::nullopt;

	auto digits = filename.substr(chunk_prefix.size(), filename.size() - chunk_prefix.size() - chunk_suffix.size());

	std::int64_t index = 0;
	for (auto ch : digits)
	{
		if (ch < '0' || ch > '9')
			return std::nullopt;
		index = index * 10 + (ch - '0');
	}

	// only the canonical spelling, so "chunk_0000001.ts" is not chunk 1
	if (chunk_filename(index) != filename)
		return std::nullopt;

	return index;
}

} // end of namespace cot
