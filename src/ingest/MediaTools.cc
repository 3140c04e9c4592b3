/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "MediaTools.hh"

#include <boost/exception/info.hpp>

namespace cot {

void CancelToken::check() const
{
	if (cancelled())
		BOOST_THROW_EXCEPTION(Cancelled() << Message{"Job cancelled"});
}

} // end of namespace cot
