/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "ServiceContext.hh"

#include "crypto/BearerToken.hh"
#include "crypto/ChunkGrant.hh"
#include "delivery/ChunkResolver.hh"
#include "ingest/FFmpeg.hh"
#include "ingest/HTTPFetcher.hh"
#include "ingest/IngestService.hh"
#include "ingest/JobRegistry.hh"
#include "ingest/JobStore.hh"
#include "ingest/Transcoder.hh"
#include "storage/MetadataStore.hh"
#include "storage/StorageLocator.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <memory>

namespace cot {

class Configuration;
class Listener;
class RequestHandler;

/// The main application logic of chunky otter.
/// Owns every service and the I/O context that runs the HTTP sessions.
class Server
{
public:
	explicit Server(const Configuration& cfg);
	~Server();

	void listen();

	/// Run the I/O context on the configured number of threads until stop()
	/// is called or SIGINT/SIGTERM arrives.
	void run();
	void stop();

	boost::asio::io_context& get_io_context();
	boost::asio::ip::tcp::endpoint local_endpoint() const;

	RequestHandler start_session();

	ServiceContext& context() {return m_ctx;}

private:
	const Configuration&    m_cfg;
	boost::asio::io_context m_ioc;
	boost::asio::signal_set m_signals;

	StorageLocator  m_locator;
	MetadataStore   m_metadata;
	ChunkResolver   m_resolver;
	ChunkGrant      m_grants;
	BearerToken     m_tokens;

	MemoryJobStore  m_job_store;
	JobRegistry     m_jobs;
	FFmpeg          m_ffmpeg;
	Transcoder      m_transcoder;
	HTTPFetcher     m_fetcher;
	IngestService   m_ingest;

	ServiceContext  m_ctx;
	std::shared_ptr<Listener> m_listener;
};

} // end of namespace
