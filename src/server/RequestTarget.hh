/*
	Copyright © 2023 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cot {

/// Path segments and query string of a request target. Segments are URL-decoded.
class RequestTarget
{
public:
	explicit RequestTarget(std::string_view target = {});

	[[nodiscard]] auto path() const {return m_path;}
	[[nodiscard]] auto query() const {return m_query;}

	[[nodiscard]] const std::vector<std::string>& segments() const {return m_segments;}
	[[nodiscard]] std::size_t size() const {return m_segments.size();}
	[[nodiscard]] std::string_view segment(std::size_t index) const;

	/// Returns true if the segments are exactly the arguments. "*" matches any one segment.
	template <typename... Segments>
	bool match(Segments... segments) const
	{
		std::string_view expected[] = {segments...};
		if (sizeof...(segments) != m_segments.size())
			return false;

		for (std::size_t i = 0; i < m_segments.size(); ++i)
			if (expected[i] != "*" && expected[i] != m_segments[i])
				return false;
		return true;
	}

	/// URL-decoded value of a query parameter, nullopt if absent.
	[[nodiscard]] std::optional<std::string> option(std::string_view name) const;

private:
	std::string_view m_path;
	std::string_view m_query;
	std::vector<std::string> m_segments;
};

} // end of namespace
