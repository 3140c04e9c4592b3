/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "util/MMap.hh"

#include <boost/beast/http/message.hpp>
#include <boost/optional/optional.hpp>

namespace cot {

/// Response body that sends a mapped region of a file in one buffer.
class MMapResponseBody
{
public:
	using value_type = MMapView;

	static std::uint64_t size(const value_type& body);

	class writer
	{
	public:
		using const_buffers_type = boost::asio::const_buffer;

		template<bool isRequest, class Fields>
		explicit
		writer(boost::beast::http::header<isRequest, Fields> const&, value_type const& body)
			: m_body(body)
		{
		}

		void init(boost::system::error_code& ec);

		boost::optional<std::pair<const_buffers_type, bool>>
		get(boost::system::error_code& ec);

	private:
		const value_type& m_body;
	};
};

} // end of namespace cot
