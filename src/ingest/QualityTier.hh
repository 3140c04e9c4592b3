/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cot {

/// One encoding tier: output dimension and bitrates in kbit/s.
struct QualityTier
{
	std::string name;
	int width{};
	int height{};
	int video_kbps{};
	int audio_kbps{};

	std::string resolution() const;
	std::string video_bitrate() const;
	std::string audio_bitrate() const;
};

/// \brief  The configured tier table.
///
/// Tiers keep the order they are added. The "lowest" tier is the one with
/// the smallest height, which is the tier that is always encoded even if the
/// source is smaller than every tier.
class QualityTable
{
public:
	QualityTable();
	explicit QualityTable(std::vector<QualityTier> tiers);

	const QualityTier* find(std::string_view name) const;
	bool valid(std::string_view name) const {return find(name) != nullptr;}

	const QualityTier& lowest() const;
	std::vector<std::string> names() const;
	const std::vector<QualityTier>& tiers() const {return m_tiers;}

	void add(QualityTier tier);

	std::vector<QualityTier> select(const std::vector<std::string>& requested, int source_height) const;

private:
	std::vector<QualityTier> m_tiers;
};

} // end of namespace
