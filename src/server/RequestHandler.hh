/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include "RequestTarget.hh"
#include "ServiceContext.hh"

#include "net/Request.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>
#include <system_error>

namespace cot {

class MMapResponseBody;
class TempFile;

/// \brief  Handles one HTTP request of a Session.
///
/// Session asks on_request_header() how to read the body, reads it with the
/// matching parser, then passes the complete request to on_request_body().
class RequestHandler
{
public:
	enum class RequestBodyType {empty, string, upload};

	// JSON request bodies larger than this are rejected
	static const std::uint64_t json_body_limit = 10UL * 1024 * 1024;

public:
	explicit RequestHandler(ServiceContext& ctx);

	/// Choose the parser for the request body. Returns a response instead if
	/// the request is rejected before its body is read.
	std::optional<StringResponse> on_request_header(const RequestHeader& header);
	RequestBodyType body_type() const {return m_body_type;}

	void prepare_upload(TempFile& file, std::error_code& ec);

	// This function produces an HTTP response for the given
	// request. The type of the response object depends on the
	// contents of the request, so the interface requires the
	// caller to pass a generic lambda for receiving the response.
	template<class Request, class Send>
	void on_request_body(Request&& req, Send&& send);

	static StringResponse json_response(nlohmann::json data, unsigned version, http::status status = http::status::ok);
	static StringResponse error_response(
		http::status status, std::string_view message, unsigned version,
		const nlohmann::json& details = nullptr
	);
	static StringResponse exception_response(std::exception_ptr error, unsigned version);

	static StringResponse bad_request(std::string_view why, unsigned version);
	static StringResponse not_found(std::string_view what, unsigned version);
	static StringResponse server_error(std::string_view what, unsigned version);

	/// Non-negative decimal integer without sign or blanks.
	static std::optional<std::int64_t> parse_index(std::string_view text);

private:
	template <class Request, class Send>
	void dispatch(Request&& req, const RequestTarget& target, Send&& send);

	template <class Send>
	void on_chunk(const EmptyRequest& req, const RequestTarget& target, Send&& send);

	std::optional<StringResponse> check_bearer(const RequestHeader& header) const;
	std::optional<StringResponse> check_grant(
		const RequestTarget& target, std::string_view video_id, std::string_view quality,
		std::int64_t index, unsigned version
	) const;

	StringResponse health(unsigned version) const;
	StringResponse public_config(unsigned version) const;
	StringResponse issue_token(const StringRequest& req) const;

	StringResponse list_videos(unsigned version) const;
	StringResponse video_metadata(const std::string& video_id, unsigned version) const;
	StringResponse manifest(const std::string& video_id, const RequestTarget& target, unsigned version) const;
	StringResponse signed_urls(const std::string& video_id, const RequestTarget& target, unsigned version) const;
	http::response<MMapResponseBody> thumbnail(const std::string& video_id, unsigned version) const;

	StringResponse upload(UploadRequest&& req, const RequestTarget& target);
	StringResponse from_url(const StringRequest& req);
	StringResponse list_jobs(unsigned version) const;
	StringResponse get_job(const std::string& job_id, unsigned version) const;
	StringResponse delete_job(const std::string& job_id, unsigned version);

	StringResponse chunk_range(const std::string& video_id, const std::string& quality, const RequestTarget& target, unsigned version) const;
	EmptyResponse chunk_by_time(const std::string& video_id, const std::string& quality, std::string_view time, const RequestTarget& target, unsigned version) const;

	template <class Response>
	void set_chunk_headers(Response& res, const std::string& video_id, const std::string& quality, std::int64_t index) const;

private:
	ServiceContext& m_ctx;
	RequestBodyType m_body_type{RequestBodyType::empty};

	std::chrono::steady_clock::time_point m_on_header;
};

} // end of namespace cot
