/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <boost/asio/ip/tcp.hpp>

#include <functional>
#include <memory>

namespace cot {

class RequestHandler;

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener>
{
public:
	Listener(
		boost::asio::io_context& ioc,
		const boost::asio::ip::tcp::endpoint& endpoint,
		std::function<RequestHandler()> factory,
		std::size_t upload_limit
	);

	void run();
	void stop();

	boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
	void do_accept();
	void on_accept(boost::system::error_code ec);

private:
	boost::asio::ip::tcp::acceptor  m_acceptor;
	boost::asio::ip::tcp::socket    m_socket;

	std::function<RequestHandler()> m_factory;

	// configurations
	std::size_t m_upload_limit;

	// stats
	std::size_t m_session_count{};
};

} // end of cot namespace
