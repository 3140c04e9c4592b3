/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cot {

/// \brief  In-memory form of metadata.json
///
/// Fields written by other tools are kept in extra and written back unchanged.
struct VideoMeta
{
	std::string     title;
	std::string     description;
	double          duration{};          //!< seconds
	std::uint32_t   chunk_duration{};    //!< seconds, fixed for the lifetime of the video
	std::int64_t    total_chunks{};
	std::vector<std::string>            qualities;
	std::map<std::string, std::string>  resolutions;
	std::map<std::string, std::string>  bitrates;
	std::optional<std::string>          thumbnail;
	std::string                         created_at;
	std::optional<std::string>          updated_at;
	std::optional<std::string>          source_url;
	std::optional<std::string>          source_title;

	nlohmann::json  extra = nlohmann::json::object();

	bool has_quality(std::string_view quality) const;
};

void to_json(nlohmann::json& json, const VideoMeta& meta);
void from_json(const nlohmann::json& json, VideoMeta& meta);

// ceil(duration / chunk_duration)
std::int64_t count_chunks(double duration, std::uint32_t chunk_duration);

} // end of namespace cot
