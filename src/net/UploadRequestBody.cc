/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "UploadRequestBody.hh"

namespace cot {

void UploadRequestBody::reader::init(const boost::optional<std::uint64_t>&, boost::system::error_code& ec)
{
	if (!m_body.is_open())
		ec.assign(EBADF, boost::system::generic_category());
	else
		ec.assign(0, ec.category());
}

void UploadRequestBody::reader::finish(boost::system::error_code& ec)
{
	// flush to disk before the job reads it
	m_body.close(ec);
}

} // end of namespace cot
