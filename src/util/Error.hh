/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <system_error>

namespace cot {

enum class Error
{
	ok,

	// chunk grants
	grant_expired,
	signature_mismatch,

	// bearer tokens
	invalid_token,
	token_expired,

	// job registry
	job_not_found,
	job_terminal,
	invalid_transition
};

const std::error_category& cot_error_category();
std::error_code make_error_code(Error err);

} // end of namespace cot

namespace std
{
	template <> struct is_error_code_enum<cot::Error> : true_type {};
}
