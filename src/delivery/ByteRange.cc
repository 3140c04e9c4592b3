/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunky_otter
    distribution for more details.
*/

#include "ByteRange.hh"

namespace cot {
namespace {

std::string_view leading_digits(std::string_view& in)
{
	std::size_t n = 0;
	while (n < in.size() && in[n] >= '0' && in[n] <= '9')
		++n;

	auto result = in.substr(0, n);
	in.remove_prefix(n);
	return result;
}

std::optional<std::uint64_t> to_number(std::string_view digits)
{
	// more than 19 digits may overflow
	if (digits.empty() || digits.size() > 19)
		return std::nullopt;

	std::uint64_t value = 0;
	for (auto ch : digits)
		value = value * 10 + static_cast<std::uint64_t>(ch - '0');
	return value;
}

} // end of local namespace

std::string ByteRange::content_range(std::uint64_t size) const
{
	return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(size);
}

std::optional<ByteRange> parse_byte_range(std::optional<std::string_view> header, std::uint64_t size)
{
	if (!header || size == 0)
		return std::nullopt;

	auto remain = *header;
	auto prefix = remain.find("bytes=");
	if (prefix == remain.npos)
		return std::nullopt;
	remain.remove_prefix(prefix + 6);

	auto first = leading_digits(remain);
	if (remain.empty() || remain.front() != '-')
		return std::nullopt;
	remain.remove_prefix(1);
	auto last = leading_digits(remain);

	auto start = first.empty() ? std::optional<std::uint64_t>{0}        : to_number(first);
	auto end   = last.empty()  ? std::optional<std::uint64_t>{size - 1} : to_number(last);
	if (!start || !end || *start >= size || *end >= size || *start > *end)
		return std::nullopt;

	return ByteRange{*start, *end, *end - *start + 1};
}

} // end of namespace cot
