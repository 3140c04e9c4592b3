/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "QualityTier.hh"

#include <algorithm>

namespace cot {

std::string QualityTier::resolution() const
{
	return std::to_string(width) + "x" + std::to_string(height);
}

std::string QualityTier::video_bitrate() const
{
	return std::to_string(video_kbps) + "k";
}

std::string QualityTier::audio_bitrate() const
{
	return std::to_string(audio_kbps) + "k";
}

QualityTable::QualityTable() : m_tiers{
	{"1080p", 1920, 1080, 5000, 192},
	{"720p",  1280, 720,  2500, 128},
	{"480p",  854,  480,  1000, 128},
	{"360p",  640,  360,  500,  96}
}
{
}

QualityTable::QualityTable(std::vector<QualityTier> tiers) : m_tiers{std::move(tiers)}
{
}

const QualityTier* QualityTable::find(std::string_view name) const
{
	auto it = std::find_if(m_tiers.begin(), m_tiers.end(), [name](auto& tier){return tier.name == name;});
	return it != m_tiers.end() ? &*it : nullptr;
}

const QualityTier& QualityTable::lowest() const
{
	return *std::min_element(m_tiers.begin(), m_tiers.end(), [](auto& a, auto& b){return a.height < b.height;});
}

std::vector<std::string> QualityTable::names() const
{
	std::vector<std::string> result;
	for (auto&& tier : m_tiers)
		result.push_back(tier.name);
	return result;
}

void QualityTable::add(QualityTier tier)
{
	auto it = std::find_if(m_tiers.begin(), m_tiers.end(), [&tier](auto& t){return t.name == tier.name;});
	if (it != m_tiers.end())
		*it = std::move(tier);
	else
		m_tiers.push_back(std::move(tier));
}

std::vector<QualityTier> QualityTable::select(const std::vector<std::string>& requested, int source_height) const
{
	std::vector<QualityTier> result;
	for (auto&& name : requested)
	{
		auto tier = find(name);

		// unknown names and duplicates are dropped, upscaling is not allowed
		if (tier && tier->height <= source_height &&
			std::none_of(result.begin(), result.end(), [&name](auto& t){return t.name == name;}))
			result.push_back(*tier);
	}

	// never produce an asset without any tier
	if (result.empty() && !m_tiers.empty())
		result.push_back(lowest());

	return result;
}

} // end of namespace
