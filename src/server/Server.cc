/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Server.hh"

#include "RequestHandler.hh"

#include "net/Listener.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>

#include <csignal>
#include <thread>
#include <vector>

namespace cot {

namespace {

const boost::filesystem::path& ensure_directory(const boost::filesystem::path& dir, const char *name)
{
	boost::system::error_code ec;
	if (dir.empty())
		BOOST_THROW_EXCEPTION(Configuration::Error() << Message{std::string{name} + " is not configured"});

	boost::filesystem::create_directories(dir, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode{ec}
			<< Message{std::string{"cannot create "} + name + " " + dir.string()}
		);
	return dir;
}

} // end of local namespace

Server::Server(const Configuration& cfg) :
	m_cfg{cfg},
	m_ioc{static_cast<int>(std::max<std::size_t>(1, cfg.thread_count()))},
	m_signals{m_ioc, SIGINT, SIGTERM},
	m_locator{ensure_directory(cfg.storage_path(), "storage_path")},
	m_metadata{m_locator},
	m_resolver{m_metadata, cfg.default_quality()},
	m_grants{cfg.secret()},
	m_tokens{cfg.secret(), cfg.token_expiry()},
	m_jobs{m_job_store},
	m_ffmpeg{cfg.ffmpeg(), cfg.ffprobe()},
	m_transcoder{m_ffmpeg, m_ffmpeg, m_metadata, cfg.qualities(), cfg.chunk_duration()},
	m_fetcher{cfg.download_timeout()},
	m_ingest{
		m_jobs, m_transcoder, m_fetcher,
		ensure_directory(cfg.temp_path(), "temp_path"),
		cfg.default_ingest_qualities(), cfg.job_threads()
	},
	m_ctx{cfg, m_metadata, m_resolver, m_grants, m_tokens, m_jobs, m_ingest}
{
}

Server::~Server() = default;

void Server::listen()
{
	m_listener = std::make_shared<Listener>(
		m_ioc,
		m_cfg.listen_http(),
		[this](){return start_session();},
		m_cfg.upload_limit()
	);
	m_listener->run();

	Log(LOG_NOTICE, "listening on %1%", m_listener->local_endpoint());
}

void Server::run()
{
	m_signals.async_wait([this](auto ec, int signal)
	{
		if (!ec)
		{
			Log(LOG_NOTICE, "received signal %1%, shutting down", signal);
			stop();
		}
	});

	auto const threads = std::max<std::size_t>(1, m_cfg.thread_count());

	// Run the I/O service on the requested number of threads
	std::vector<std::thread> v;
	v.reserve(threads - 1);
	for (auto i = threads - 1; i > 0; --i)
		v.emplace_back([this]{m_ioc.run();});

	m_ioc.run();

	for (auto& t : v)
		t.join();
}

void Server::stop()
{
	if (m_listener)
		m_listener->stop();

	boost::system::error_code ec;
	m_signals.cancel(ec);
	m_ioc.stop();
}

boost::asio::io_context& Server::get_io_context()
{
	return m_ioc;
}

boost::asio::ip::tcp::endpoint Server::local_endpoint() const
{
	return m_listener ? m_listener->local_endpoint() : boost::asio::ip::tcp::endpoint{};
}

RequestHandler Server::start_session()
{
	return RequestHandler{m_ctx};
}

} // end of namespace
