/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "RemoteFetcher.hh"

#include "util/Escape.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/info.hpp>

#include <algorithm>
#include <cctype>
#include <ostream>

namespace cot {

std::string to_string(DownloadReason reason)
{
	switch (reason)
	{
		case DownloadReason::timeout:          return "timeout";
		case DownloadReason::bad_status:       return "badStatus";
		case DownloadReason::bad_content_type: return "badContentType";
		case DownloadReason::transport:        return "transport";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, DownloadReason reason)
{
	return os << to_string(reason);
}

bool URL::default_port() const
{
	return (https() && port == "443") || (!https() && port == "80");
}

std::string URL::host_header() const
{
	auto result = host.find(':') != host.npos ? "[" + host + "]" : host;
	return default_port() ? result : result + ":" + port;
}

std::string URL::str() const
{
	return scheme + "://" + host_header() + target;
}

std::optional<URL> URL::resolve(std::string_view location) const
{
	if (location.substr(0, 2) == "//")
		return parse_url(scheme + ":" + std::string{location});

	if (!location.empty() && location.front() == '/')
	{
		auto result = *this;
		result.target = location;
		return result;
	}

	if (auto absolute = parse_url(location))
		return absolute;

	if (location.empty())
		return std::nullopt;

	// relative to the directory of the current target
	auto result = *this;
	auto path = target.substr(0, target.find_first_of("?#"));
	result.target = path.substr(0, path.rfind('/') + 1) + std::string{location};
	return result;
}

std::optional<URL> parse_url(std::string_view url)
{
	auto [scheme, colon] = split_left(url, ":");
	if (colon != ':' || url.substr(0, 2) != "//")
		return std::nullopt;
	url.remove_prefix(2);

	URL result;
	result.scheme = boost::algorithm::to_lower_copy(std::string{scheme});
	if (result.scheme != "http" && result.scheme != "https")
		return std::nullopt;

	auto authority = url.substr(0, url.find_first_of("/?#"));
	url.remove_prefix(authority.size());

	// user info is not used
	if (auto at = authority.rfind('@'); at != authority.npos)
		authority.remove_prefix(at + 1);

	std::string_view port;
	if (!authority.empty() && authority.front() == '[')
	{
		auto close = authority.find(']');
		if (close == authority.npos)
			return std::nullopt;
		result.host = authority.substr(1, close - 1);
		auto rest = authority.substr(close + 1);
		if (!rest.empty() && rest.front() == ':')
			port = rest.substr(1);
		else if (!rest.empty())
			return std::nullopt;
	}
	else
	{
		auto colon_pos = authority.find(':');
		result.host = authority.substr(0, colon_pos);
		if (colon_pos != authority.npos)
			port = authority.substr(colon_pos + 1);
	}

	if (result.host.empty() ||
		!std::all_of(port.begin(), port.end(), [](char c){return std::isdigit(static_cast<unsigned char>(c));}) ||
		port.size() > 5)
		return std::nullopt;

	result.host = boost::algorithm::to_lower_copy(result.host);
	result.port = port.empty() ? (result.https() ? "443" : "80") : std::string{port};

	// fragments are never sent
	auto target = url.substr(0, url.find('#'));
	result.target = target.empty() || target.front() != '/' ? "/" + std::string{target} : std::string{target};
	return result;
}

bool is_youtube(const URL& url)
{
	auto& host = url.host;
	return host == "youtube.com" || host == "youtu.be" ||
		boost::algorithm::ends_with(host, ".youtube.com") ||
		boost::algorithm::ends_with(host, ".youtu.be");
}

URL validate_source_url(std::string_view url)
{
	auto parsed = parse_url(boost::algorithm::trim_copy(std::string{url}));
	if (!parsed)
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{"Invalid URL format. Only http and https URLs are supported."}
			<< BadInput{std::string{url}}
		);

	if (is_youtube(*parsed))
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{
				"YouTube URLs are not supported. "
				"Please use a direct video URL (e.g. .mp4 or .webm files)."
			}
			<< BadInput{std::string{url}}
		);

	return *parsed;
}

std::string title_from_url(const URL& url)
{
	std::string_view path{url.target};
	path = path.substr(0, path.find('?'));

	auto name = url_decode(path.substr(path.rfind('/') + 1));
	if (auto dot = name.rfind('.'); dot != name.npos && dot > 0)
		name.erase(dot);

	bool word_start = true;
	for (auto& ch : name)
	{
		if (ch == '-' || ch == '_')
			ch = ' ';

		if (std::isalnum(static_cast<unsigned char>(ch)))
		{
			if (word_start)
				ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
			word_start = false;
		}
		else
			word_start = true;
	}

	boost::algorithm::trim(name);
	return name.empty() ? "Video" : name;
}

} // end of namespace cot
