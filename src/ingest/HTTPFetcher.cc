/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "HTTPFetcher.hh"

#include "util/Log.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/exception/info.hpp>

#include <openssl/err.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <type_traits>

namespace cot {

using tcp = boost::asio::ip::tcp;
namespace ssl  = boost::asio::ssl;
namespace http = boost::beast::http;

namespace {

const std::string user_agent = "chunky_otter/1.0 " BOOST_BEAST_VERSION_STRING;

/// Result of one request in the redirect chain.
struct FetchState
{
	struct Failure
	{
		DownloadReason  reason;
		std::string     message;
		unsigned        status{};
	};

	bool                        done{false};
	bool                        cancelled{false};
	std::optional<std::string>  redirect;
	std::optional<Failure>      failure;

	bool finished() const {return done || cancelled || redirect || failure;}
};

bool acceptable_content_type(std::string_view content_type)
{
	// a response without Content-Type is rejected too
	auto type = boost::algorithm::to_lower_copy(std::string{content_type});
	return boost::algorithm::contains(type, "video") || boost::algorithm::contains(type, "octet-stream");
}

bool is_ip_address(const std::string& host)
{
	boost::system::error_code ec;
	boost::asio::ip::make_address(host, ec);
	return !ec;
}

// Performs one GET and streams the response body into the destination file
template <typename Stream>
class Fetch : public FetchState, public std::enable_shared_from_this<Fetch<Stream>>
{
public:
	static constexpr bool is_ssl = !std::is_same<Stream, tcp::socket>::value;

	template <typename... StreamArgs>
	Fetch(
		boost::asio::io_context& ioc,
		const URL& url,
		TempFile& dest,
		const DownloadProgressCallback& progress,
		const CancelToken& cancel,
		StreamArgs&... args
	) :
		m_resolver{ioc}, m_stream{ioc, args...}, m_url{url},
		m_dest{dest}, m_progress{progress}, m_cancel{cancel}
	{
		m_parser.body_limit(std::numeric_limits<std::uint64_t>::max());
	}

	// Start the asynchronous operation
	void run()
	{
		if constexpr (is_ssl)
		{
			// Set SNI Hostname (many hosts need this to handshake successfully)
			if (!is_ip_address(m_url.host) && !SSL_set_tlsext_host_name(m_stream.native_handle(), m_url.host.c_str()))
			{
				boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
				return fail(ec, "SSL_set_tlsext_host_name");
			}
			m_stream.set_verify_mode(ssl::verify_peer);
			m_stream.set_verify_callback(ssl::host_name_verification{m_url.host});
		}

		m_req.version(11);
		m_req.method(http::verb::get);
		m_req.target(m_url.target);
		m_req.set(http::field::host, m_url.host_header());
		m_req.set(http::field::user_agent, user_agent);
		m_req.set(http::field::accept, "*/*");
		m_req.set(http::field::accept_encoding, "identity");

		m_resolver.async_resolve(
			m_url.host,
			m_url.port,
			[self=this->shared_from_this()](auto ec, auto&& results){self->on_resolve(ec, std::move(results));}
		);
	}

private:
	void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results)
	{
		if (ec)
			return fail(ec, "resolve");

		boost::asio::async_connect(
			boost::beast::get_lowest_layer(m_stream),
			results.begin(),
			results.end(),
			[self=this->shared_from_this()](auto ec, auto&&){self->on_connect(ec);}
		);
	}

	void on_connect(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "connect");

		if constexpr (is_ssl)
			m_stream.async_handshake(
				ssl::stream_base::client,
				[self=this->shared_from_this()](auto ec){self->on_handshake(ec);}
			);
		else
			on_handshake(ec);
	}

	void on_handshake(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "handshake");

		http::async_write(
			m_stream, m_req,
			[self=this->shared_from_this()](auto ec, auto){self->on_write(ec);}
		);
	}

	void on_write(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "write");

		http::async_read_header(
			m_stream, m_buffer, m_parser,
			[self=this->shared_from_this()](auto ec, auto){self->on_header(ec);}
		);
	}

	void on_header(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "read");

		auto& res = m_parser.get();
		auto status = res.result_int();
		if (status >= 300 && status < 400 && res.count(http::field::location) > 0)
		{
			redirect = std::string{res[http::field::location]};
			return close();
		}

		if (status < 200 || status >= 300)
		{
			failure = Failure{
				DownloadReason::bad_status,
				"Server returned " + std::to_string(status) + ": " + std::string{res.reason()},
				status
			};
			return close();
		}

		auto content_type = res[http::field::content_type];
		if (!acceptable_content_type(content_type))
		{
			failure = Failure{
				DownloadReason::bad_content_type,
				"Invalid content type: " + std::string{content_type} + ". Expected video file.",
				status
			};
			return close();
		}

		m_total = m_parser.content_length().value_or(0);
		if (m_parser.is_done())
			return on_complete();

		read_body();
	}

	void read_body()
	{
		m_parser.get().body().data = m_chunk.data();
		m_parser.get().body().size = m_chunk.size();
		http::async_read(
			m_stream, m_buffer, m_parser,
			[self=this->shared_from_this()](auto ec, auto){self->on_body(ec);}
		);
	}

	void on_body(boost::system::error_code ec)
	{
		// the body buffer is full, which is not an error
		if (ec == http::error::need_buffer)
			ec = {};
		if (ec)
			return fail(ec, "read");

		auto count = m_chunk.size() - m_parser.get().body().size;
		if (count > 0)
		{
			m_dest.write(m_chunk.data(), count, ec);
			if (ec)
				return fail(ec, "write file");

			m_downloaded += count;
			report_progress();
		}

		if (m_cancel.cancelled())
		{
			cancelled = true;
			return close();
		}

		if (m_parser.is_done())
			on_complete();
		else
			read_body();
	}

	void report_progress()
	{
		if (m_total == 0 || !m_progress)
			return;

		auto percent = std::min(100.0, std::floor(m_downloaded * 100.0 / m_total));
		if (percent >= m_last_percent + 5.0 || (percent == 100.0 && m_last_percent < 100.0))
		{
			m_last_percent = percent;
			m_progress(DownloadProgress{m_downloaded, m_total, percent});
		}
	}

	void on_complete()
	{
		done = true;
		Log(LOG_INFO, "downloaded %1% bytes from %2%", m_downloaded, m_url.str());
		close();
	}

	void fail(boost::system::error_code ec, const char *what)
	{
		failure = Failure{
			DownloadReason::transport,
			"Download failed: " + std::string{what} + ": " + ec.message()
		};
		close();
	}

	// The connection is never reused so there is no need for a graceful shutdown.
	void close()
	{
		boost::system::error_code ec;
		boost::beast::get_lowest_layer(m_stream).close(ec);
	}

private:
	tcp::resolver               m_resolver;
	Stream                      m_stream;
	boost::beast::flat_buffer   m_buffer;
	http::request<http::empty_body>         m_req;
	http::response_parser<http::buffer_body> m_parser;
	std::array<char, 64*1024>   m_chunk;

	URL                         m_url;
	TempFile&                   m_dest;
	const DownloadProgressCallback& m_progress;
	CancelToken                 m_cancel;

	std::uint64_t               m_downloaded{};
	std::uint64_t               m_total{};
	double                      m_last_percent{-5.0};
};

} // end of local namespace

HTTPFetcher::HTTPFetcher(std::chrono::seconds timeout, std::size_t max_redirects) :
	m_timeout{timeout}, m_max_redirects{max_redirects}
{
}

void HTTPFetcher::fetch(
	const URL& url,
	TempFile& dest,
	const DownloadProgressCallback& progress,
	const CancelToken& cancel
)
{
	auto deadline = std::chrono::steady_clock::now() + m_timeout;

	auto throw_failure = [&dest, &url](DownloadReason reason, const std::string& message, unsigned status)
	{
		dest.discard();
		BOOST_THROW_EXCEPTION(DownloadFailure()
			<< Message{message}
			<< Reason{reason}
			<< HTTPStatus{status}
			<< SourceURL{url.str()}
		);
	};

	auto current = url;
	for (std::size_t redirects = 0; ; ++redirects)
	{
		ssl::context ctx{ssl::context::tls_client};
		ctx.set_default_verify_paths();

		boost::asio::io_context ioc;
		std::shared_ptr<FetchState> state;
		if (current.https())
		{
			auto op = std::make_shared<Fetch<ssl::stream<tcp::socket>>>(ioc, current, dest, progress, cancel, ctx);
			op->run();
			state = op;
		}
		else
		{
			auto op = std::make_shared<Fetch<tcp::socket>>(ioc, current, dest, progress, cancel);
			op->run();
			state = op;
		}

		ioc.run_until(deadline);

		if (state->cancelled)
		{
			dest.discard();
			cancel.check();
		}

		if (!state->finished())
			throw_failure(DownloadReason::timeout, "Download timed out", 0);

		if (state->failure)
			throw_failure(state->failure->reason, state->failure->message, state->failure->status);

		if (state->done)
			return;

		// redirected
		auto next = current.resolve(*state->redirect);
		if (!next)
			throw_failure(DownloadReason::transport, "Invalid redirect location: " + *state->redirect, 0);
		if (redirects + 1 > m_max_redirects)
			throw_failure(DownloadReason::transport, "Too many redirects", 0);

		Log(LOG_INFO, "following redirect from %1% to %2%", current.str(), next->str());
		current = std::move(*next);
	}
}

} // end of namespace cot
