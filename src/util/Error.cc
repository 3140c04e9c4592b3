/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Error.hh"

#include <string>

namespace cot {

const std::error_category& cot_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "chunky_otter"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::grant_expired: return "expired";
				case Error::signature_mismatch: return "signature mismatch";
				case Error::invalid_token: return "invalid token";
				case Error::token_expired: return "token expired";
				case Error::job_not_found: return "job not found";
				case Error::job_terminal: return "job already finished";
				case Error::invalid_transition: return "invalid job status transition";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), cot_error_category());
}

} // end of namespace
