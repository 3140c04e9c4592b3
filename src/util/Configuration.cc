/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Configuration.hh"

#include "Log.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/filesystem.hpp>

#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace cot {
namespace {

ip::tcp::endpoint parse_endpoint(const nlohmann::json& json)
{
	return {
		ip::make_address(json.value("address", std::string{"0.0.0.0"})),
		json.value("port", static_cast<unsigned short>(3000))
	};
}

std::chrono::seconds seconds(const nlohmann::json& json, const char *ptr, std::chrono::seconds def)
{
	using jptr = nlohmann::json::json_pointer;
	return std::chrono::seconds{json.value(jptr{ptr}, def.count())};
}

} // end of local namespace

std::string CacheSetting::header(bool immutable) const
{
	return "public, max-age=" + std::to_string(max_age.count()) +
		", s-maxage=" + std::to_string(s_max_age.count()) +
		", stale-while-revalidate=" + std::to_string(stale_while_revalidate.count()) +
		(immutable ? ", immutable" : "");
}

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",        "produce help message")
		("issue-token", po::value<std::string>()->value_name("user"), "print a bearer token for the user and exit")
		("transcode",   po::value<std::string>()->value_name("file"), "transcode a local video file into the storage and exit")
		("video-id",    po::value<std::string>()->value_name("id"), "video ID used with --transcode (default: random)")
		("cfg",         po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable CHUNKY_OTTER_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() :
			env ? std::string{env} : std::string{constants::config_filename}
		);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const boost::filesystem::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		// Paths are relative to the configuration file
		m_storage_path  = weakly_canonical(absolute(json.at(jptr{"/storage_path"}).get<std::string>(), path.parent_path()));
		m_temp_path     = weakly_canonical(absolute(json.at(jptr{"/temp_path"}).get<std::string>(),    path.parent_path()));
		m_secret        = json.at(jptr{"/secret"}).get<std::string>();
		if (m_secret.empty())
			BOOST_THROW_EXCEPTION(Error() << Message{"secret must not be empty"});

		m_thread_count   = json.value(jptr{"/thread_count"}, m_thread_count);
		m_job_threads    = json.value(jptr{"/job_threads"},  m_job_threads);
		m_chunk_duration = json.value(jptr{"/chunk_duration"}, m_chunk_duration);
		if (m_chunk_duration == 0)
			BOOST_THROW_EXCEPTION(Error() << Message{"chunk_duration must be positive"});

		m_upload_limit  = static_cast<std::size_t>(
			json.value(jptr{"/upload_limit_mb"}, m_upload_limit/1024.0/1024.0) * 1024 * 1024
		);

		if (auto tiers = json.value(jptr{"/qualities"}, nlohmann::json::object_t{}); !tiers.empty())
		{
			std::vector<QualityTier> table;
			for (auto&& [name, tier] : tiers)
			{
				auto width  = tier.value("width", 0);
				auto height = tier.value("height", 0);
				if (width > 0 && height > 0)
					table.push_back({name, width, height, tier.value("video_bitrate", 1000), tier.value("audio_bitrate", 128)});
			}
			if (table.empty())
				BOOST_THROW_EXCEPTION(Error() << Message{"no valid quality tier"});
			m_qualities = QualityTable{std::move(table)};
		}

		m_default_quality  = json.value(jptr{"/default_quality"}, m_default_quality);
		if (!m_qualities.valid(m_default_quality))
			BOOST_THROW_EXCEPTION(Error() << Message{"default_quality is not a configured tier"} << BadInput{m_default_quality});

		m_ingest_qualities = json.value(jptr{"/default_ingest_qualities"}, m_ingest_qualities);
		m_allowed_types    = json.value(jptr{"/allowed_types"}, m_allowed_types);

		m_enable_auth       = json.value(jptr{"/enable_auth"}, m_enable_auth);
		m_signed_url_expiry = seconds(json, "/signed_url_expiry_sec", m_signed_url_expiry);
		m_token_expiry      = seconds(json, "/token_expiry_sec",      m_token_expiry);

		m_cache.max_age                = seconds(json, "/cache/max_age",                m_cache.max_age);
		m_cache.s_max_age              = seconds(json, "/cache/s_max_age",              m_cache.s_max_age);
		m_cache.stale_while_revalidate = seconds(json, "/cache/stale_while_revalidate", m_cache.stale_while_revalidate);

		m_download_timeout = seconds(json, "/download_timeout_sec", m_download_timeout);
		m_job_list_limit   = json.value(jptr{"/job_list_limit"}, m_job_list_limit);

		if (auto level = json.value(jptr{"/log_level"}, std::string{}); !level.empty())
		{
			auto parsed = ParseLogLevel(level);
			if (!parsed)
				BOOST_THROW_EXCEPTION(Error() << Message{"unknown log_level"} << BadInput{level});
			m_log_level = *parsed;
		}

		m_ffmpeg  = json.value(jptr{"/ffmpeg"},  m_ffmpeg);
		m_ffprobe = json.value(jptr{"/ffprobe"}, m_ffprobe);

		if (auto http = json.value(jptr{"/http"}, nlohmann::json::object_t{}); !http.empty())
			m_listen_http = parse_endpoint(http);
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

void Configuration::change_listen_port(std::uint16_t http)
{
	m_listen_http.port(http);
}

} // end of namespace
