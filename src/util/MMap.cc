/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "MMap.hh"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace cot {

MMap MMap::open(int fd, std::error_code& ec)
{
	MMap result;

	struct stat s{};
	if (::fstat(fd, &s) != 0)
		ec.assign(errno, std::generic_category());

	// mmap() refuses zero-length mappings: an empty file is an empty view
	else if (s.st_size > 0)
		result.mmap(fd, static_cast<std::size_t>(s.st_size), ec);

	else
		ec.clear();

	return result;
}

MMap MMap::open(const boost::filesystem::path& path, std::error_code& ec)
{
	auto fd = ::open(path.string().c_str(), O_RDONLY);
	if (fd < 0)
	{
		ec.assign(errno, std::generic_category());
		return {};
	}

	auto result = open(fd, ec);

	// the mapping stays valid after the file descriptor is closed
	::close(fd);
	return result;
}

void MMap::mmap(int fd, std::size_t size, std::error_code& ec)
{
	auto addr = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
	if (addr == MAP_FAILED)
	{
		m_mmap = nullptr;
		m_size = 0;
		ec.assign(errno, std::generic_category());
	}
	else
	{
		m_mmap = addr;
		m_size = size;
		ec.clear();
	}
}

MMap::~MMap()
{
	if (is_opened())
		clear();
}

void MMap::clear()
{
	if (m_mmap)
		::munmap(m_mmap, m_size);
	m_mmap = nullptr;
	m_size = 0;
}

void MMap::swap(MMap& target) noexcept
{
	std::swap(m_mmap, target.m_mmap);
	std::swap(m_size, target.m_size);
}

MMap::MMap(MMap&& m) noexcept
{
	swap(m);
}

MMap& MMap::operator=(MMap&& rhs) noexcept
{
	MMap copy{std::move(rhs)};
	swap(copy);
	return *this;
}

} // end of namespace
