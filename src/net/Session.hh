/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include "Request.hh"
#include "UploadRequestBody.hh"

#include "server/RequestHandler.hh"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace cot {

// Handles an HTTP server connection
class Session : public std::enable_shared_from_this<Session>
{
public:
	// Take ownership of the socket
	Session(
		std::function<RequestHandler()> factory,
		boost::asio::ip::tcp::socket    socket,
		std::size_t                     nth,
		std::size_t                     upload_limit
	);

	// Start the asynchronous operation
	void run();
	void do_read();
	void on_read_header(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_write(boost::system::error_code ec, std::size_t bytes_transferred, bool close);
	void do_close();

private:
	template<class Request>
	bool validate_request(const Request& req);

	template <class Response>
	void send_response(Response&& response);

	void handle_read_error(std::string_view where, boost::system::error_code ec);
	void init_request_body(RequestHandler::RequestBodyType body_type, std::error_code& ec);

private:
	tcp::socket                 m_socket;
	boost::beast::flat_buffer   m_buffer;

	bool m_keep_alive{false};

	// The parsed message are stored inside the parsers.
	// Use parser::get() or release() to get the message.
	std::optional<HeaderRequestParser> m_parser;
	std::variant<EmptyRequestParser, StringRequestParser, UploadRequestParser> m_body;

	std::function<RequestHandler()> m_factory;
	std::optional<RequestHandler>   m_handler;

	// configurations
	std::size_t m_upload_size_limit;

	// stats
	std::size_t m_nth_session;
	std::size_t m_nth_transaction{};
};

} // end of namespace
