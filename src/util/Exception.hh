/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <string>
#include <system_error>

namespace cot {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};

// Bad input from the client or the command line
struct ValidationError : virtual Exception {};

// Job was cancelled while it was running
struct Cancelled : virtual Exception {};

using ErrorCode = boost::error_info<struct tag_error_code,  std::error_code>;
using Message   = boost::error_info<struct tag_message,     std::string>;
using BadInput  = boost::error_info<struct tag_bad_input,   std::string>;
using VideoID   = boost::error_info<struct tag_video_id,    std::string>;

// Human readable message attached to the exception, or its what() if there is none.
std::string message_of(const std::exception& e);

} // end of namespace
