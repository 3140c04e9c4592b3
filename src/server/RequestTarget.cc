/*
	Copyright © 2023 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "RequestTarget.hh"
#include "util/Escape.hh"

namespace cot {

RequestTarget::RequestTarget(std::string_view target)
{
	// Extract the query string:
	// only truncate "target" when "?" is found; keep "target" unchanged if "?" is not found
	// use split_left() because the query string starts from the _first_ '?' according to
	// [RFC 3986](https://tools.ietf.org/html/rfc3986#page-23).
	auto tmp = target;
	auto[field, sep] = split_left(tmp, "?");
	if (sep == '?')
	{
		m_query = tmp;
		target  = field;
	}

	m_path = target.empty() ? "/" : target;

	// empty segments come from repeated or trailing slashes
	auto remain = m_path;
	while (!remain.empty())
	{
		auto [segment, slash] = split_left(remain, "/");
		if (!segment.empty())
			m_segments.push_back(url_decode(segment));
	}
}

std::string_view RequestTarget::segment(std::size_t index) const
{
	return index < m_segments.size() ? std::string_view{m_segments[index]} : std::string_view{};
}

std::optional<std::string> RequestTarget::option(std::string_view name) const
{
	auto remain = m_query;
	while (!remain.empty())
	{
		auto [key, match] = split_left(remain, "=&;");
		auto value = (match == '=' ? std::get<0>(split_left(remain, "&;")) : std::string_view{});

		if (url_decode(key) == name)
			return url_decode(value);
	}
	return std::nullopt;
}

} // end of namespace cot
