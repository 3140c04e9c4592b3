/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "util/MMap.hh"

#include <catch2/catch.hpp>

#include <boost/filesystem.hpp>
#include <fstream>

using namespace cot;

TEST_CASE("mmap a small file", "[normal]")
{
	auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
	{
		std::ofstream out{path.string()};
		out << "0123456789";
	}

	std::error_code ec;
	auto subject = MMap::open(path, ec);
	REQUIRE(!ec);
	REQUIRE(subject.is_opened());
	REQUIRE(subject.size() == 10);
	REQUIRE(subject.string() == "0123456789");

	MMapView view{std::move(subject), 2, 5};
	REQUIRE_FALSE(subject.is_opened());
	REQUIRE(view.file.is_opened());
	REQUIRE(std::string_view{static_cast<const char*>(view.buffer().data()), view.buffer().size()} == "23456");

	view.file.clear();
	REQUIRE_FALSE(view.file.is_opened());
	boost::filesystem::remove(path);
}

TEST_CASE("mmap a missing file", "[error]")
{
	std::error_code ec;
	auto subject = MMap::open(boost::filesystem::path{"/no/such/chunk.ts"}, ec);
	REQUIRE(ec == std::errc::no_such_file_or_directory);
	REQUIRE_FALSE(subject.is_opened());
}
