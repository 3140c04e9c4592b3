/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/get_error_info.hpp>

namespace cot {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

std::string message_of(const std::exception& e)
{
	if (auto msg = boost::get_error_info<Message>(e))
		return *msg;
	else if (dynamic_cast<const Exception*>(&e))
		return "internal error";
	else
		return e.what();
}

} // end of namespace
