/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "TempFile.hh"

#include "util/Log.hh"

#include <boost/filesystem/operations.hpp>

#include <cerrno>
#include <cstdlib>
#include <utility>

namespace fs = boost::filesystem;

namespace cot {

TempFile::TempFile(TempFile&& other) noexcept :
	m_file{std::move(other.m_file)},
	m_path{std::exchange(other.m_path, {})}
{
}

TempFile& TempFile::operator=(TempFile&& other) noexcept
{
	if (this != &other)
	{
		discard();
		m_file = std::move(other.m_file);
		m_path = std::exchange(other.m_path, {});
	}
	return *this;
}

TempFile::~TempFile()
{
	discard();
}

void TempFile::discard() noexcept
{
	boost::system::error_code ec;
	if (m_file.is_open())
		m_file.close(ec);

	if (!m_path.empty())
	{
		fs::remove(m_path, ec);
		if (ec)
			Log(LOG_WARNING, "cannot remove temporary file %1%: %2%", m_path, ec.message());
		m_path.clear();
	}
}

void TempFile::open(const fs::path& directory, std::string_view prefix, boost::system::error_code& ec)
{
	discard();

	// mkstemp() works everywhere, including network mounts
	auto tmp = (directory / (std::string{prefix} + "-XXXXXX")).string();
	int fd = ::mkstemp(&tmp[0]);

	if (fd < 0)
		ec.assign(errno, boost::system::generic_category());
	else
	{
		m_file.native_handle(fd);
		m_path = tmp;
		ec.clear();
	}
}

bool TempFile::is_open() const
{
	return m_file.is_open();
}

void TempFile::close(boost::system::error_code& ec)
{
	m_file.close(ec);
}

std::uint64_t TempFile::size(boost::system::error_code& ec) const
{
	if (m_file.is_open())
		return m_file.size(ec);

	auto size = fs::file_size(m_path, ec);
	return ec ? 0 : size;
}

std::size_t TempFile::write(void const *buffer, std::size_t n, boost::system::error_code& ec)
{
	return m_file.write(buffer, n, ec);
}

} // end of namespace cot
