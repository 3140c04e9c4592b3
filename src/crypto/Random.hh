/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#pragma once

#include <array>
#include <string>
#include <type_traits>

namespace cot {

void secure_random(void *buf, std::size_t size);

template <typename T>
std::enable_if_t<std::is_standard_layout<T>::value, T> secure_random()
{
	T val;
	secure_random(&val, sizeof(val));
	return val;
}

template <typename T, std::size_t size>
std::enable_if_t<std::is_standard_layout<T>::value, std::array<T, size>> secure_random_array()
{
	return secure_random<std::array<T, size>>();
}

// Random (version 4) UUID in its canonical lower case text form.
std::string random_uuid();

} // end of namespace cot
