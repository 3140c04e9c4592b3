/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Session.hh"

#include "server/RequestHandler.ipp"
#include "util/Log.hh"

#include "config.hh"

#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/format.hpp>

namespace cot {

Session::Session(
	std::function<RequestHandler()> factory,
	boost::asio::ip::tcp::socket socket,
	std::size_t             nth,
	std::size_t             upload_limit
) :
	m_socket{std::move(socket)},
	m_factory{std::move(factory)},
	m_upload_size_limit{upload_limit},
	m_nth_session{nth}
{
}

// Start the asynchronous operation
void Session::run()
{
	do_read();
}

void Session::do_read()
{
	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();

	m_handler.emplace(m_factory());
	m_parser->body_limit(m_upload_size_limit);

	// Read the header of a request
	http::async_read_header(
		m_socket, m_buffer, *m_parser,
		[self=shared_from_this()](auto ec, auto bytes) {self->on_read_header(ec, bytes);}
	);
}

void Session::on_read_header(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(__PRETTY_FUNCTION__, ec);

	// Get the HTTP header from the partially parsed request message from the parser.
	// The body of the request message has not parsed yet.
	auto&& header = m_parser->get();
	auto version  = header.version();
	m_keep_alive  = header.keep_alive();

	if (!validate_request(header))
		return;

	// The body is never read so the connection cannot be reused.
	if (auto rejected = m_handler->on_request_header(header))
	{
		m_keep_alive = false;
		return send_response(std::move(*rejected));
	}

	std::error_code init_ec;
	init_request_body(m_handler->body_type(), init_ec);
	if (init_ec)
	{
		Log(LOG_WARNING, "cannot initialize request parser: %1% (%2%)", init_ec.message(), init_ec);
		m_keep_alive = false;
		return send_response(RequestHandler::server_error("Internal server error", version));
	}

	// Call async_read() using the chosen parser to read and parse the request body.
	std::visit([this, self=shared_from_this()](auto&& parser)
	{
		http::async_read(
			m_socket, m_buffer, parser,
			[self](auto ec, auto bytes){ self->on_read(ec, bytes); }
		);
	}, m_body);
}

void Session::on_read(boost::system::error_code ec, std::size_t)
{
	// This means they closed the connection
	if (ec)
		return handle_read_error(__PRETTY_FUNCTION__, ec);

	std::visit([this, self=shared_from_this()](auto&& parser)
	{
		m_handler->on_request_body(
			parser.release(), [this, self](auto&& response)
			{
				send_response(std::forward<decltype(response)>(response));
			}
		);
	}, m_body);

	m_nth_transaction++;
}

template<class Request>
bool Session::validate_request(const Request& req)
{
	// Make sure we can handle the method
	if (req.method() != http::verb::get  &&
	    req.method() != http::verb::post &&
	    req.method() != http::verb::delete_ &&
	    req.method() != http::verb::head)
	{
		m_keep_alive = false;
		send_response(RequestHandler::bad_request("Unknown HTTP-method", req.version()));
		return false;
	}

	// Request path must be absolute and not contain "..".
	if (req.target().empty() ||
	    req.target()[0] != '/' ||
	    req.target().find("..") != boost::beast::string_view::npos)
	{
		m_keep_alive = false;
		send_response(RequestHandler::bad_request("Illegal request-target", req.version()));
		return false;
	}
	return true;
}

template <class Response>
void Session::send_response(Response&& response)
{
	static const std::string version =
		(boost::format{"%1% chunky_otter/%2%"} % BOOST_BEAST_VERSION_STRING % constants::version).str();

	// The lifetime of the message has to extend
	// for the duration of the async operation so
	// we use a shared_ptr to manage it.
	auto sp = std::make_shared<std::remove_reference_t<Response>>(std::forward<Response>(response));
	sp->set(http::field::server, version);
	sp->keep_alive(m_keep_alive);

	// HEAD responses carry the length of the entity they describe
	if (!sp->has_content_length())
		sp->prepare_payload();

	http::async_write(
		m_socket, *sp,
		[self=shared_from_this(), sp](auto&& ec, auto bytes)
		{
			self->on_write(ec, bytes, sp->need_eof());
		}
	);
}

void Session::handle_read_error(std::string_view where, boost::system::error_code ec)
{
	// This means they closed the connection
	if (ec == http::error::end_of_stream || ec == boost::asio::error::connection_reset)
		return do_close();

	Log(LOG_INFO, "%1%:%2% read error in %3%: %4%", m_nth_session, m_nth_transaction, where, ec.message());

	m_keep_alive = false;
	if (ec == http::error::body_limit)
		return send_response(RequestHandler::error_response(
			http::status::payload_too_large, "Request body too large", 11
		));

	send_response(RequestHandler::bad_request(ec.message(), 11));
}

void Session::on_write(
	boost::system::error_code ec,
	std::size_t,
	bool close)
{
	if (ec)
		Log(LOG_INFO, "%1%:%2% write error: %3%", m_nth_session, m_nth_transaction, ec.message());

	if (close || ec)
	{
		// This means we should close the connection, usually because
		// the response indicated the "Connection: close" semantic.
		return do_close();
	}

	// Read another request
	do_read();
}

void Session::do_close()
{
	// Send a TCP shutdown
	boost::system::error_code ec;
	m_socket.shutdown(tcp::socket::shutdown_send, ec);

	// At this point the connection is closed gracefully
}

void Session::init_request_body(RequestHandler::RequestBodyType body_type, std::error_code& ec)
{
	switch (body_type)
	{
	case RequestHandler::RequestBodyType::empty:
		m_body.emplace<EmptyRequestParser>(std::move(*m_parser));
		break;

	case RequestHandler::RequestBodyType::string:
	{
		auto& parser = m_body.emplace<StringRequestParser>(std::move(*m_parser));
		parser.body_limit(RequestHandler::json_body_limit);
		break;
	}

	case RequestHandler::RequestBodyType::upload:
		auto& parser = m_body.emplace<UploadRequestParser>(std::move(*m_parser));
		m_handler->prepare_upload(parser.get().body(), ec);
		break;
	}
}

} // end of namespace
