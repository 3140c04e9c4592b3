/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "RequestHandler.hh"

#include "delivery/ByteRange.hh"
#include "delivery/ChunkResolver.hh"
#include "net/MMapResponseBody.hh"
#include "net/UploadRequestBody.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/exception/info.hpp>

#include <string>
#include <type_traits>

namespace cot {

template <class Request, class Send>
void RequestHandler::on_request_body(Request&& req, Send&& send)
{
	auto version = req.version();
	auto method  = req.method();
	std::string path{req.target().data(), req.target().size()};
	RequestTarget target{path};

	// Chunk requests are only logged when they fail
	auto reply = [&send, &target, &path, method, this](auto&& res)
	{
		using namespace std::chrono;
		auto status = res.result_int();
		if (target.segment(1) != "chunks" || status >= 400)
			Log(
				status >= 500 ? LOG_WARNING : LOG_INFO,
				"%1% %2% %3% (%4% ms)",
				method, path, status,
				duration_cast<milliseconds>(steady_clock::now() - m_on_header).count()
			);
		send(std::forward<decltype(res)>(res));
	};

	try
	{
		dispatch(std::forward<Request>(req), target, reply);
	}
	catch (std::exception&)
	{
		reply(exception_response(std::current_exception(), version));
	}
}

template <class Request, class Send>
void RequestHandler::dispatch(Request&& req, const RequestTarget& target, Send&& send)
{
	using RequestType = std::remove_cv_t<std::remove_reference_t<Request>>;

	auto version = req.version();
	auto method  = req.method();
	auto video_id = std::string{target.segment(2)};

	if constexpr (std::is_same<RequestType, EmptyRequest>::value)
	{
		if (target.segment(0) == "api" && target.segment(1) == "chunks")
			return on_chunk(req, target, std::forward<Send>(send));

		if (method == http::verb::get)
		{
			if (target.match("api", "health"))
				return send(health(version));
			if (target.match("api", "config"))
				return send(public_config(version));
			if (target.match("api", "videos"))
				return send(list_videos(version));

			// "jobs" is not a video ID
			if (target.match("api", "videos", "jobs") || target.match("api", "videos", "jobs", "*"))
			{
				if (auto denied = check_bearer(req))
					return send(std::move(*denied));

				return target.size() == 3 ?
					send(list_jobs(version)) :
					send(get_job(std::string{target.segment(3)}, version));
			}

			if (target.match("api", "videos", "*"))
				return send(video_metadata(video_id, version));
			if (target.match("api", "videos", "*", "manifest"))
				return send(manifest(video_id, target, version));
			if (target.match("api", "videos", "*", "thumbnail"))
				return send(thumbnail(video_id, version));

			if (target.match("api", "videos", "*", "signed-urls"))
			{
				if (auto denied = check_bearer(req))
					return send(std::move(*denied));
				return send(signed_urls(video_id, target, version));
			}
		}
		else if (method == http::verb::delete_ && target.match("api", "videos", "jobs", "*"))
		{
			if (auto denied = check_bearer(req))
				return send(std::move(*denied));
			return send(delete_job(std::string{target.segment(3)}, version));
		}
	}

	if constexpr (std::is_same<RequestType, StringRequest>::value)
	{
		if (method == http::verb::post && target.match("api", "auth", "token"))
			return send(issue_token(req));

		if (method == http::verb::post && target.match("api", "videos", "from-url"))
		{
			if (auto denied = check_bearer(req))
				return send(std::move(*denied));
			return send(from_url(req));
		}
	}

	// The bearer token was checked before reading the body
	if constexpr (std::is_same<RequestType, UploadRequest>::value)
	{
		if (method == http::verb::post && target.match("api", "videos", "upload"))
			return send(upload(std::move(req), target));
	}

	return send(not_found("Resource not found", version));
}

template <class Send>
void RequestHandler::on_chunk(const EmptyRequest& req, const RequestTarget& target, Send&& send)
{
	auto version = req.version();
	auto video_id = std::string{target.segment(2)};
	auto quality  = std::string{target.segment(3)};

	// "range" and "by-time" must be matched before the chunk index
	if (req.method() == http::verb::get && target.match("api", "chunks", "*", "*", "range"))
		return send(chunk_range(video_id, quality, target, version));

	if (req.method() == http::verb::get && target.match("api", "chunks", "*", "*", "by-time", "*"))
		return send(chunk_by_time(video_id, quality, target.segment(5), target, version));

	if ((req.method() != http::verb::get && req.method() != http::verb::head) ||
		!target.match("api", "chunks", "*", "*", "*"))
		return send(not_found("Resource not found", version));

	auto index = parse_index(target.segment(4));
	if (!index)
		return send(bad_request("Invalid chunk index", version));

	if (auto denied = check_grant(target, video_id, quality, *index, version))
		return send(std::move(*denied));

	auto chunk = m_ctx.resolver.resolve(video_id, quality, *index);

	if (req.method() == http::verb::head)
	{
		EmptyResponse res{http::status::ok, version};
		set_chunk_headers(res, video_id, chunk.quality, *index);
		res.content_length(chunk.size);
		return send(std::move(res));
	}

	auto range_header = req[http::field::range];
	auto range = parse_byte_range(
		range_header.empty() ?
			std::nullopt :
			std::optional<std::string_view>{std::string_view{range_header.data(), range_header.size()}},
		chunk.size
	);

	std::error_code ec;
	auto view = chunk.open(range, ec);
	if (ec == std::errc::no_such_file_or_directory)
		BOOST_THROW_EXCEPTION(ChunkFileNotFound()
			<< Message{"Chunk not found"}
			<< ErrorCode{ec}
			<< VideoID{video_id}
			<< RequestedIndex{*index}
		);
	else if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< Message{"Cannot read chunk"}
			<< ErrorCode{ec}
			<< VideoID{video_id}
			<< RequestedIndex{*index}
		);

	http::response<MMapResponseBody> res{
		std::piecewise_construct,
		std::make_tuple(std::move(view)),
		std::make_tuple(range ? http::status::partial_content : http::status::ok, version)
	};
	set_chunk_headers(res, video_id, chunk.quality, *index);
	if (range)
		res.set(http::field::content_range, range->content_range(chunk.size));

	return send(std::move(res));
}

template <class Response>
void RequestHandler::set_chunk_headers(
	Response& res, const std::string& video_id,
	const std::string& quality, std::int64_t index
) const
{
	res.set(http::field::content_type,  "video/mp2t");
	res.set(http::field::accept_ranges, "bytes");
	res.set(http::field::cache_control, m_ctx.cfg.cache().header(true));
	res.set("X-Chunk-Index", std::to_string(index));
	res.set("X-Video-Id",    video_id);
	res.set("X-Quality",     quality);
}

} // end of namespace cot
