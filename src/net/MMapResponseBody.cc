/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "MMapResponseBody.hh"

namespace cot {

std::uint64_t MMapResponseBody::size(const value_type& body)
{
	return body.length;
}

void MMapResponseBody::writer::init(boost::system::error_code& ec)
{
	ec.assign(0, ec.category());
}

boost::optional<std::pair<MMapResponseBody::writer::const_buffers_type, bool>>
MMapResponseBody::writer::get(boost::system::error_code& ec)
{
	ec.assign(0, ec.category());

	// empty files are never mapped
	if (m_body.length == 0)
		return boost::none;

	return {
		{m_body.buffer(), false} // pair
	}; // optional
}

} // end of namespace cot
