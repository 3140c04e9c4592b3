/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "TestStorage.hh"

#include "ingest/HTTPFetcher.hh"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/exception/get_error_info.hpp>

#include <atomic>
#include <iterator>
#include <thread>

using namespace cot;
using namespace std::chrono_literals;

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

const std::string video_body(200 * 1024, 'V');

/// Serves a few canned responses on 127.0.0.1, one request per connection.
class LoopbackServer
{
public:
	LoopbackServer()
	{
		m_acceptor.open(tcp::v4());
		m_acceptor.set_option(tcp::acceptor::reuse_address(true));
		m_acceptor.bind({boost::asio::ip::make_address("127.0.0.1"), 0});
		m_acceptor.listen();
		m_thread = std::thread{[this]{serve();}};
	}
	~LoopbackServer()
	{
		m_stop = true;

		// wake up the blocking accept()
		boost::system::error_code ec;
		tcp::socket wake{m_ioc};
		wake.connect(m_acceptor.local_endpoint(), ec);
		m_thread.join();
	}

	std::string url(const std::string& target) const
	{
		return "http://127.0.0.1:" + std::to_string(m_acceptor.local_endpoint().port()) + target;
	}

	std::size_t requests() const {return m_requests;}

private:
	void serve()
	{
		while (!m_stop)
		{
			boost::system::error_code ec;
			tcp::socket socket{m_ioc};
			m_acceptor.accept(socket, ec);
			if (ec || m_stop)
				break;

			boost::beast::flat_buffer buffer;
			http::request<http::string_body> req;
			http::read(socket, buffer, req, ec);
			if (ec)
				continue;

			++m_requests;
			respond(socket, req);
		}
	}

	void respond(tcp::socket& socket, const http::request<http::string_body>& req)
	{
		boost::system::error_code ec;
		http::response<http::string_body> res{http::status::ok, req.version()};
		res.keep_alive(false);

		auto target = req.target();
		if (target == "/video.mp4")
		{
			res.set(http::field::content_type, "video/mp4");
			res.body() = video_body;
		}
		else if (target == "/binary")
		{
			res.set(http::field::content_type, "application/octet-stream; charset=binary");
			res.body() = "0123456789";
		}
		else if (target == "/redirect")
		{
			res.result(http::status::found);
			res.set(http::field::location, "video.mp4");
		}
		else if (target == "/loop")
		{
			res.result(http::status::moved_permanently);
			res.set(http::field::location, "/loop");
		}
		else if (target == "/page.html")
		{
			res.set(http::field::content_type, "text/html");
			res.body() = "<html></html>";
		}
		else if (target == "/untyped")
		{
			// no Content-Type at all
			res.body() = "<html></html>";
		}
		else if (target == "/slow")
		{
			std::this_thread::sleep_for(1500ms);
			res.set(http::field::content_type, "video/mp4");
			res.body() = "late";
		}
		else
		{
			res.result(http::status::not_found);
			res.set(http::field::content_type, "text/plain");
			res.body() = "not found";
		}

		res.prepare_payload();
		http::write(socket, res, ec);
		socket.shutdown(tcp::socket::shutdown_send, ec);
	}

private:
	boost::asio::io_context m_ioc;
	tcp::acceptor           m_acceptor{m_ioc};
	std::thread             m_thread;
	std::atomic<bool>       m_stop{false};
	std::atomic<std::size_t> m_requests{0};
};

std::string read_file(const boost::filesystem::path& path)
{
	std::ifstream in{path.string(), std::ios::binary};
	return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

struct FetchFixture
{
	LoopbackServer  server;
	TestStorage     storage;
	HTTPFetcher     subject{1s, 3};
	TempFile        dest;
	std::vector<DownloadProgress> progress;

	FetchFixture()
	{
		boost::system::error_code ec;
		dest.open(storage.root(), "download", ec);
		REQUIRE(!ec);
	}

	void fetch(const std::string& target, const CancelToken& cancel = {})
	{
		subject.fetch(*parse_url(server.url(target)), dest, [this](auto& p){progress.push_back(p);}, cancel);
	}

	DownloadFailure fetch_failure(const std::string& target)
	{
		try
		{
			fetch(target);
		}
		catch (DownloadFailure& e)
		{
			return e;
		}
		FAIL("download of " << target << " did not fail");
		return {};
	}
};

}

TEST_CASE("download a video", "[normal]")
{
	FetchFixture f;
	f.fetch("/video.mp4");

	boost::system::error_code ec;
	f.dest.close(ec);
	REQUIRE(!ec);
	REQUIRE(read_file(f.dest.path()) == video_body);

	// progress in steps ending at 100%
	REQUIRE(f.progress.size() >= 2);
	REQUIRE(f.progress.back().percent == 100);
	REQUIRE(f.progress.back().downloaded == video_body.size());
	REQUIRE(f.progress.back().total == video_body.size());
	for (std::size_t i = 1; i < f.progress.size(); ++i)
		REQUIRE(f.progress[i].percent > f.progress[i-1].percent);
}

TEST_CASE("follow redirects", "[normal]")
{
	FetchFixture f;
	f.fetch("/redirect");
	REQUIRE(f.server.requests() == 2);

	boost::system::error_code ec;
	REQUIRE(f.dest.size(ec) == video_body.size());
}

TEST_CASE("octet-stream is accepted", "[normal]")
{
	FetchFixture f;
	f.fetch("/binary");

	boost::system::error_code ec;
	REQUIRE(f.dest.size(ec) == 10);
}

TEST_CASE("download failures", "[error]")
{
	FetchFixture f;

	SECTION("not found")
	{
		auto e = f.fetch_failure("/missing.mp4");
		REQUIRE(*boost::get_error_info<Reason>(e) == DownloadReason::bad_status);
		REQUIRE(*boost::get_error_info<HTTPStatus>(e) == 404);
		REQUIRE(message_of(e) == "Server returned 404: Not Found");
		REQUIRE(*boost::get_error_info<SourceURL>(e) == f.server.url("/missing.mp4"));
	}
	SECTION("not a video")
	{
		auto e = f.fetch_failure("/page.html");
		REQUIRE(*boost::get_error_info<Reason>(e) == DownloadReason::bad_content_type);
		REQUIRE(message_of(e) == "Invalid content type: text/html. Expected video file.");
	}
	SECTION("missing content type")
	{
		auto e = f.fetch_failure("/untyped");
		REQUIRE(*boost::get_error_info<Reason>(e) == DownloadReason::bad_content_type);
		REQUIRE(message_of(e) == "Invalid content type: . Expected video file.");
	}
	SECTION("redirect loop")
	{
		auto e = f.fetch_failure("/loop");
		REQUIRE(*boost::get_error_info<Reason>(e) == DownloadReason::transport);
		REQUIRE(message_of(e) == "Too many redirects");
		REQUIRE(f.server.requests() == 4);
	}
	SECTION("timeout")
	{
		auto e = f.fetch_failure("/slow");
		REQUIRE(*boost::get_error_info<Reason>(e) == DownloadReason::timeout);
		REQUIRE(message_of(e) == "Download timed out");
	}

	// the partial file is removed
	REQUIRE(f.dest.path().empty());
	REQUIRE(f.progress.empty());
}

TEST_CASE("connection refused", "[error]")
{
	// find a port nobody listens on
	boost::asio::io_context ioc;
	tcp::acceptor acceptor{ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
	auto port = acceptor.local_endpoint().port();
	acceptor.close();

	TestStorage storage;
	TempFile dest;
	boost::system::error_code ec;
	dest.open(storage.root(), "download", ec);
	REQUIRE(!ec);

	HTTPFetcher subject{1s};
	auto url = *parse_url("http://127.0.0.1:" + std::to_string(port) + "/video.mp4");
	REQUIRE_THROWS_AS(subject.fetch(url, dest, {}, {}), DownloadFailure);
	REQUIRE(dest.path().empty());
}

TEST_CASE("cancel a download", "[normal]")
{
	FetchFixture f;
	CancelToken cancel;
	cancel.cancel();

	REQUIRE_THROWS_AS(f.fetch("/video.mp4", cancel), Cancelled);
	REQUIRE(f.dest.path().empty());
}
