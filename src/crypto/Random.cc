/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "Random.hh"

#include "util/Escape.hh"

#include <sys/random.h>

#include <cerrno>
#include <system_error>

namespace cot {

void secure_random(void *buf, std::size_t size)
{
	if (::getrandom(buf, size, 0) != static_cast<ssize_t>(size))
		throw std::system_error(errno, std::generic_category());
}

std::string random_uuid()
{
	auto bytes = secure_random_array<unsigned char, 16>();
	bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
	bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

	auto hex = to_hex(bytes.data(), bytes.size());
	return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
		hex.substr(16, 4) + "-" + hex.substr(20);
}

} // end of namespace cot
