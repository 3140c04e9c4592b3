/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "Request.hh"

#include "ingest/TempFile.hh"

#include <boost/optional/optional.hpp>

namespace cot {

/// Streams the request body into a TempFile. The file must be opened before
/// the body is read.
class UploadRequestBody
{
public:
	using value_type = TempFile;

	class reader
	{
	public:
		template<bool is_request, class Fields>
		explicit reader(http::header<is_request, Fields>&, value_type& body) : m_body{body}
		{
		}

		void init(const boost::optional<std::uint64_t>&, boost::system::error_code& ec);

		template<class ConstBufferSequence>
		std::size_t put(const ConstBufferSequence& buffers, boost::system::error_code& ec)
		{
			std::size_t total = 0;

			for (auto it = boost::asio::buffer_sequence_begin(buffers); it != boost::asio::buffer_sequence_end(buffers); ++it)
			{
				boost::asio::const_buffer buf = *it;
				total += m_body.write(buf.data(), buf.size(), ec);
				if (ec)
					return total;
			}

			ec.assign(0, ec.category());
			return total;
		}

		void finish(boost::system::error_code& ec);

	private:
		value_type& m_body;
	};
};

} // end of namespace cot
