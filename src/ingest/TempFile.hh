/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include <boost/beast/core/file_posix.hpp>
#include <boost/filesystem/path.hpp>

#include <string>
#include <string_view>

namespace cot {

/// \brief  Job private temporary file, removed when the object is destroyed.
///
/// Used for uploaded request bodies and downloaded sources. The owner of the
/// object owns the file, so moving the object moves the responsibility to
/// remove it.
class TempFile
{
public:
	TempFile() = default;
	TempFile(const TempFile&) = delete;
	TempFile(TempFile&& other) noexcept;
	~TempFile();

	TempFile& operator=(const TempFile&) = delete;
	TempFile& operator=(TempFile&& other) noexcept;

	/// Create a new file named "{prefix}-XXXXXX" in the directory
	void open(const boost::filesystem::path& directory, std::string_view prefix, boost::system::error_code& ec);

	/// Returns `true` if the file is open
	bool is_open() const;

	/// Close the file but keep it on disk
	void close(boost::system::error_code& ec);

	/// Return the size of the file
	std::uint64_t size(boost::system::error_code& ec) const;

	/// Write to the open file
	std::size_t write(void const* buffer, std::size_t n, boost::system::error_code& ec);

	/// Close and remove the file now
	void discard() noexcept;

	[[nodiscard]] const boost::filesystem::path& path() const {return m_path;}

private:
	boost::beast::file_posix m_file{};
	boost::filesystem::path  m_path{};
};

} // end of namespace cot
