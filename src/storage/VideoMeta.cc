/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "VideoMeta.hh"

#include <algorithm>
#include <cmath>

namespace cot {
namespace {

const char* const known_fields[] = {
	"title", "description", "duration", "chunkDuration", "totalChunks", "qualities",
	"resolutions", "bitrates", "thumbnail", "createdAt", "updatedAt", "sourceUrl", "sourceTitle"
};

template <typename T>
void optional_field(const nlohmann::json& json, const char *name, std::optional<T>& field)
{
	if (auto it = json.find(name); it != json.end() && !it->is_null())
		field = it->get<T>();
	else
		field.reset();
}

} // end of local namespace

bool VideoMeta::has_quality(std::string_view quality) const
{
	return std::find(qualities.begin(), qualities.end(), quality) != qualities.end();
}

std::int64_t count_chunks(double duration, std::uint32_t chunk_duration)
{
	return chunk_duration > 0 ? static_cast<std::int64_t>(std::ceil(duration / chunk_duration)) : 0;
}

void to_json(nlohmann::json& json, const VideoMeta& meta)
{
	json = meta.extra.is_object() ? meta.extra : nlohmann::json::object();
	json["title"]         = meta.title;
	json["description"]   = meta.description;
	json["duration"]      = meta.duration;
	json["chunkDuration"] = meta.chunk_duration;
	json["totalChunks"]   = meta.total_chunks;
	json["qualities"]     = meta.qualities;
	json["resolutions"]   = meta.resolutions;
	json["bitrates"]      = meta.bitrates;
	json["thumbnail"]     = meta.thumbnail ? nlohmann::json(*meta.thumbnail) : nlohmann::json();
	json["createdAt"]     = meta.created_at;

	if (meta.updated_at)
		json["updatedAt"] = *meta.updated_at;
	if (meta.source_url)
		json["sourceUrl"] = *meta.source_url;
	if (meta.source_title)
		json["sourceTitle"] = *meta.source_title;
}

void from_json(const nlohmann::json& json, VideoMeta& meta)
{
	meta.title          = json.value("title", std::string{});
	meta.description    = json.value("description", std::string{});
	meta.duration       = json.at("duration").get<double>();
	meta.chunk_duration = json.at("chunkDuration").get<std::uint32_t>();
	meta.total_chunks   = json.value("totalChunks", count_chunks(meta.duration, meta.chunk_duration));
	meta.qualities      = json.at("qualities").get<std::vector<std::string>>();
	meta.resolutions    = json.value("resolutions", std::map<std::string, std::string>{});
	meta.bitrates       = json.value("bitrates",    std::map<std::string, std::string>{});
	meta.created_at     = json.value("createdAt", std::string{});

	optional_field(json, "thumbnail",   meta.thumbnail);
	optional_field(json, "updatedAt",   meta.updated_at);
	optional_field(json, "sourceUrl",   meta.source_url);
	optional_field(json, "sourceTitle", meta.source_title);

	meta.extra = nlohmann::json::object();
	for (auto&& item : json.items())
	{
		auto& key = item.key();
		if (std::none_of(std::begin(known_fields), std::end(known_fields), [&key](auto f){return key == f;}))
			meta.extra[key] = item.value();
	}
}

} // end of namespace cot
