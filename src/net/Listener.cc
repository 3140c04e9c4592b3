/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Listener.hh"
#include "Session.hh"

#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>

namespace cot {

Listener::Listener(
	boost::asio::io_context& ioc,
	const boost::asio::ip::tcp::endpoint& endpoint,
	std::function<RequestHandler()> factory,
	std::size_t upload_limit
) :
	m_acceptor{ioc},
	m_socket{ioc},
	m_factory{std::move(factory)},
	m_upload_limit{upload_limit}
{
	boost::system::error_code ec;
	auto check = [&ec, &endpoint](const char *what)
	{
		if (ec)
			BOOST_THROW_EXCEPTION(SystemError()
				<< ErrorCode{ec}
				<< Message{std::string{what} + " " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port())}
			);
	};

	// Open the acceptor
	m_acceptor.open(endpoint.protocol(), ec);
	check("cannot open acceptor for");

	m_acceptor.set_option(boost::asio::socket_base::reuse_address{true});

	// Bind to the server address
	m_acceptor.bind(endpoint, ec);
	check("cannot bind to");

	// Start listening for connections
	m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
	check("cannot listen on");
}

void Listener::run()
{
	if (m_acceptor.is_open())
		do_accept();
}

void Listener::stop()
{
	boost::system::error_code ec;
	m_acceptor.close(ec);
}

boost::asio::ip::tcp::endpoint Listener::local_endpoint() const
{
	boost::system::error_code ec;
	return m_acceptor.local_endpoint(ec);
}

void Listener::do_accept()
{
	m_acceptor.async_accept(
		m_socket,
		[self = shared_from_this()](auto ec)
		{
			self->on_accept(ec);
		}
	);
}

void Listener::on_accept(boost::system::error_code ec)
{
	if (ec == boost::asio::error::operation_aborted)
		return;

	if (ec)
	{
		Log(LOG_WARNING, "accept error: %1%", ec);
	}
	else
	{
		// Create the session and run it
		std::make_shared<Session>(m_factory, std::move(m_socket), m_session_count, m_upload_limit)->run();
		m_session_count++;
	}

	// Accept another connection
	do_accept();
}

} // end of namespace
