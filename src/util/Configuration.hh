/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "Exception.hh"
#include "ingest/QualityTier.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/filesystem/path.hpp>

#include "config.hh"

#include <syslog.h>

#include <chrono>
#include <iosfwd>
#include <optional>

namespace cot {

struct CacheSetting
{
	std::chrono::seconds max_age{86400};
	std::chrono::seconds s_max_age{604800};
	std::chrono::seconds stale_while_revalidate{86400};

	// Cache-Control header value. Chunks never change so they are immutable.
	std::string header(bool immutable) const;
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    boost::filesystem::path>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	boost::asio::ip::tcp::endpoint listen_http() const { return m_listen_http;}

	boost::filesystem::path storage_path() const {return m_storage_path;}
	boost::filesystem::path temp_path() const {return m_temp_path;}
	std::size_t thread_count() const {return m_thread_count;}
	std::size_t job_threads() const {return m_job_threads;}
	std::size_t upload_limit() const {return m_upload_limit;}
	std::uint32_t chunk_duration() const {return m_chunk_duration;}

	const QualityTable& qualities() const {return m_qualities;}
	const std::string& default_quality() const {return m_default_quality;}
	const std::vector<std::string>& default_ingest_qualities() const {return m_ingest_qualities;}
	const std::vector<std::string>& allowed_types() const {return m_allowed_types;}

	const std::string& secret() const {return m_secret;}
	bool enable_auth() const {return m_enable_auth;}
	std::chrono::seconds signed_url_expiry() const {return m_signed_url_expiry;}
	std::chrono::seconds token_expiry() const {return m_token_expiry;}
	const CacheSetting& cache() const {return m_cache;}

	std::chrono::seconds download_timeout() const {return m_download_timeout;}
	std::size_t job_list_limit() const {return m_job_list_limit;}
	int log_level() const {return m_log_level;}

	const std::string& ffmpeg() const {return m_ffmpeg;}
	const std::string& ffprobe() const {return m_ffprobe;}

	bool help() const {return m_args.count("help") > 0;}

	// one-shot commands that exit instead of starting the server
	bool command() const {return m_args.count("issue-token") > 0 || m_args.count("transcode") > 0;}

	template <typename Function>
	bool issue_token(Function&& func) const
	{
		return m_args.count("issue-token") > 0 ?
			(func(m_args["issue-token"].as<std::string>()), true) :
			false;
	}
	template <typename Function>
	bool transcode(Function&& func) const
	{
		return m_args.count("transcode") > 0 ?
			(func(
				boost::filesystem::path{m_args["transcode"].as<std::string>()},
				m_args.count("video-id") > 0 ? m_args["video-id"].as<std::string>() : std::string{}
			), true) :
			false;
	}

	void usage(std::ostream& out) const;

	// for unit tests
	void storage_path(boost::filesystem::path path) {m_storage_path = std::move(path);}
	void temp_path(boost::filesystem::path path) {m_temp_path = std::move(path);}
	void secret(std::string secret) {m_secret = std::move(secret);}
	void enable_auth(bool enable) {m_enable_auth = enable;}
	void chunk_duration(std::uint32_t sec) {m_chunk_duration = sec;}
	void change_listen_port(std::uint16_t http);

private:
	void load_config(const boost::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_listen_http{boost::asio::ip::address_v4::any(), 3000};

	boost::filesystem::path m_storage_path, m_temp_path;
	std::size_t m_thread_count{1};
	std::size_t m_job_threads{2};
	std::size_t m_upload_limit{1024UL * 1024 * 1024};
	std::uint32_t m_chunk_duration{5};

	QualityTable m_qualities;
	std::string m_default_quality{"720p"};
	std::vector<std::string> m_ingest_qualities{"720p", "480p", "360p"};
	std::vector<std::string> m_allowed_types{"video/mp4", "video/webm", "video/quicktime"};

	std::string m_secret;
	bool m_enable_auth{false};
	std::chrono::seconds m_signed_url_expiry{3600};
	std::chrono::seconds m_token_expiry{86400};
	CacheSetting m_cache;

	std::chrono::seconds m_download_timeout{300};
	std::size_t m_job_list_limit{50};
	int m_log_level{LOG_INFO};

	std::string m_ffmpeg{"ffmpeg"};
	std::string m_ffprobe{"ffprobe"};
};

} // end of namespace
