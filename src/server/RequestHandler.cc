/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#include "RequestHandler.hh"

#include "crypto/BearerToken.hh"
#include "crypto/ChunkGrant.hh"
#include "delivery/ChunkResolver.hh"
#include "ingest/IngestService.hh"
#include "ingest/JobRegistry.hh"
#include "net/MMapResponseBody.hh"
#include "net/UploadRequestBody.hh"
#include "storage/MetadataStore.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/TimeFormat.hh"
#include "util/Timestamp.hh"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>

#include <algorithm>
#include <limits>

namespace cot {

namespace {

const std::string no_cache = "no-store, no-cache, must-revalidate, proxy-revalidate";

std::string_view to_std(boost::beast::string_view s)
{
	return {s.data(), s.size()};
}

std::string message_or(const boost::exception& e, std::string fallback)
{
	auto msg = boost::get_error_info<Message>(e);
	return msg ? *msg : fallback;
}

// Integer query parameter. Throws ValidationError if present but not a number.
std::int64_t int_option(const RequestTarget& target, std::string_view name, std::int64_t default_value)
{
	auto value = target.option(name);
	if (!value || value->empty())
		return default_value;

	auto text = std::string_view{*value};
	bool negative = text.front() == '-';
	if (negative)
		text.remove_prefix(1);

	auto number = RequestHandler::parse_index(text);
	if (!number)
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{"Invalid value for " + std::string{name}}
			<< BadInput{*value}
		);
	return negative ? -*number : *number;
}

nlohmann::json parse_json_body(const StringRequest& req)
{
	if (boost::algorithm::trim_copy(req.body()).empty())
		return nlohmann::json::object();

	auto json = nlohmann::json::parse(req.body(), nullptr, false);
	if (json.is_discarded() || !json.is_object())
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"Invalid JSON"});
	return json;
}

std::string string_field(const nlohmann::json& json, const char *name)
{
	auto it = json.find(name);
	if (it == json.end() || it->is_null())
		return {};
	if (!it->is_string())
		BOOST_THROW_EXCEPTION(ValidationError() << Message{std::string{name} + " must be a string"});
	return it->get<std::string>();
}

// Accepts either a JSON array of names or a comma separated string
std::vector<std::string> quality_list(const nlohmann::json& json)
{
	auto it = json.find("qualities");
	if (it == json.end() || it->is_null())
		return {};
	if (it->is_string())
		return split_list(it->get<std::string>());

	std::vector<std::string> result;
	if (it->is_array())
		for (auto&& item : *it)
			if (item.is_string())
				result.push_back(item.get<std::string>());
			else
				BOOST_THROW_EXCEPTION(ValidationError() << Message{"qualities must be strings"});
	else
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"qualities must be an array"});
	return result;
}

nlohmann::json submission_json(const Submission& sub, const char *message)
{
	return {
		{"jobId",       sub.job_id},
		{"videoId",     sub.video_id},
		{"status",      "processing"},
		{"message",     message},
		{"statusUrl",   "/api/videos/jobs/" + sub.job_id}
	};
}

std::optional<std::string> thumbnail_url(const std::string& video_id, const VideoMeta& meta)
{
	return meta.thumbnail ? std::optional<std::string>{"/api/videos/" + video_id + "/thumbnail"} : std::nullopt;
}

} // end of local namespace

RequestHandler::RequestHandler(ServiceContext& ctx) : m_ctx{ctx}
{
}

std::optional<StringResponse> RequestHandler::on_request_header(const RequestHeader& header)
{
	m_on_header = std::chrono::steady_clock::now();
	m_body_type = RequestBodyType::empty;

	if (header.method() != http::verb::post)
		return std::nullopt;

	RequestTarget target{to_std(header.target())};
	auto length = parse_index(to_std(header[http::field::content_length]));

	if (target.match("api", "videos", "upload"))
	{
		if (auto denied = check_bearer(header))
			return denied;

		auto content_type = std::string{to_std(header[http::field::content_type])};
		content_type = boost::algorithm::trim_copy(content_type.substr(0, content_type.find(';')));

		auto& allowed = m_ctx.cfg.allowed_types();
		if (std::find(allowed.begin(), allowed.end(), content_type) == allowed.end())
			return error_response(
				http::status::unsupported_media_type,
				"Invalid file type: " + content_type + ". Allowed: " + boost::algorithm::join(allowed, ", "),
				header.version()
			);

		if (length && static_cast<std::uint64_t>(*length) > m_ctx.cfg.upload_limit())
			return error_response(http::status::payload_too_large, "File too large", header.version());

		m_body_type = RequestBodyType::upload;
	}
	else if (target.match("api", "auth", "token") || target.match("api", "videos", "from-url"))
	{
		if (length && static_cast<std::uint64_t>(*length) > json_body_limit)
			return error_response(http::status::payload_too_large, "Request body too large", header.version());

		m_body_type = RequestBodyType::string;
	}
	return std::nullopt;
}

void RequestHandler::prepare_upload(TempFile& file, std::error_code& ec)
{
	boost::system::error_code bec;
	file.open(m_ctx.cfg.temp_path(), "upload", bec);
	ec = bec;
	if (ec)
		Log(LOG_WARNING, "cannot create upload file in %1%: %2% (%3%)", m_ctx.cfg.temp_path(), ec, ec.message());
}

StringResponse RequestHandler::json_response(nlohmann::json data, unsigned version, http::status status)
{
	nlohmann::json body{
		{"success",   true},
		{"data",      std::move(data)},
		{"timestamp", Timestamp::now()}
	};

	StringResponse res{
		std::piecewise_construct,
		std::make_tuple(body.dump()),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "application/json");
	return res;
}

StringResponse RequestHandler::error_response(
	http::status status, std::string_view message, unsigned version,
	const nlohmann::json& details
)
{
	nlohmann::json error{
		{"message", message},
		{"code",    static_cast<unsigned>(status)}
	};
	if (!details.is_null())
		error.emplace("details", details);

	nlohmann::json body{
		{"success",   false},
		{"error",     std::move(error)},
		{"timestamp", Timestamp::now()}
	};

	StringResponse res{
		std::piecewise_construct,
		std::make_tuple(body.dump()),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "application/json");
	res.set(http::field::cache_control, no_cache);
	return res;
}

StringResponse RequestHandler::exception_response(std::exception_ptr error, unsigned version)
{
	try
	{
		std::rethrow_exception(error);
	}
	catch (ValidationError& e)
	{
		auto input = boost::get_error_info<BadInput>(e);
		return error_response(
			http::status::bad_request, message_or(e, "Validation failed"), version,
			input ? nlohmann::json{{"input", *input}} : nlohmann::json{}
		);
	}
	catch (VideoNotFound& e)
	{
		return error_response(http::status::not_found, message_or(e, "Video not found"), version);
	}
	catch (ChunkOutOfRange& e)
	{
		nlohmann::json details = nlohmann::json::object();
		if (auto index = boost::get_error_info<RequestedIndex>(e))
			details.emplace("requestedIndex", *index);
		if (auto total = boost::get_error_info<TotalChunks>(e))
			details.emplace("totalChunks", *total);
		return error_response(http::status::not_found, message_or(e, "Chunk not found"), version, details);
	}
	catch (QualityUnavailable& e)
	{
		nlohmann::json details = nlohmann::json::object();
		if (auto quality = boost::get_error_info<RequestedQuality>(e))
			details.emplace("requestedQuality", *quality);
		if (auto available = boost::get_error_info<AvailableQualities>(e))
			details.emplace("availableQualities", *available);
		return error_response(http::status::not_found, message_or(e, "Quality not available"), version, details);
	}
	catch (ChunkFileNotFound& e)
	{
		return error_response(http::status::not_found, message_or(e, "Chunk file not found"), version);
	}
	catch (std::exception& e)
	{
		// details stay in the log
		Log(LOG_ERR, "internal server error: %1%", boost::diagnostic_information(e));
		return server_error("Internal server error", version);
	}
}

StringResponse RequestHandler::bad_request(std::string_view why, unsigned version)
{
	return error_response(http::status::bad_request, why, version);
}

StringResponse RequestHandler::not_found(std::string_view what, unsigned version)
{
	return error_response(http::status::not_found, what, version);
}

StringResponse RequestHandler::server_error(std::string_view what, unsigned version)
{
	return error_response(http::status::internal_server_error, what, version);
}

std::optional<std::int64_t> RequestHandler::parse_index(std::string_view text)
{
	if (text.empty() || text.size() > 18)
		return std::nullopt;

	std::int64_t result = 0;
	for (auto ch : text)
	{
		if (ch < '0' || ch > '9')
			return std::nullopt;
		result = result * 10 + (ch - '0');
	}
	return result;
}

std::optional<StringResponse> RequestHandler::check_bearer(const RequestHeader& header) const
{
	if (!m_ctx.cfg.enable_auth())
		return std::nullopt;

	auto auth = to_std(header[http::field::authorization]);
	if (!boost::algorithm::istarts_with(auth, "Bearer ") || auth.size() <= 7)
		return error_response(http::status::unauthorized, "Access token required", header.version());

	std::error_code ec;
	auto claims = m_ctx.tokens.verify(auth.substr(7), ec);
	if (ec)
	{
		Log(LOG_INFO, "bearer token rejected: %1%", ec.message());
		return error_response(http::status::forbidden, "Invalid or expired token", header.version());
	}
	return std::nullopt;
}

std::optional<StringResponse> RequestHandler::check_grant(
	const RequestTarget& target, std::string_view video_id, std::string_view quality,
	std::int64_t index, unsigned version
) const
{
	if (!m_ctx.cfg.enable_auth())
		return std::nullopt;

	auto expires   = target.option("expires");
	auto signature = target.option("signature");
	if (!expires || !signature || expires->empty() || signature->empty())
		return error_response(http::status::unauthorized, "Missing signature parameters", version);

	auto expiry = parse_index(*expires);
	if (!expiry)
		return error_response(http::status::forbidden, "Invalid signature", version);

	auto ec = m_ctx.grants.verify(video_id, quality, index, *expiry, *signature);
	if (ec == Error::grant_expired)
		return error_response(http::status::forbidden, "Signed URL has expired", version);
	else if (ec)
		return error_response(http::status::forbidden, "Invalid signature", version);

	return std::nullopt;
}

StringResponse RequestHandler::health(unsigned version) const
{
	using namespace std::chrono;
	return json_response({
		{"status",    "healthy"},
		{"timestamp", Timestamp::now()},
		{"uptime",    duration_cast<duration<double>>(steady_clock::now() - m_ctx.started).count()}
	}, version);
}

StringResponse RequestHandler::public_config(unsigned version) const
{
	return json_response({
		{"chunkDuration",       m_ctx.cfg.chunk_duration()},
		{"supportedQualities",  m_ctx.cfg.qualities().names()},
		{"defaultQuality",      m_ctx.cfg.default_quality()},
		{"authEnabled",         m_ctx.cfg.enable_auth()}
	}, version);
}

StringResponse RequestHandler::issue_token(const StringRequest& req) const
{
	auto body = parse_json_body(req);

	nlohmann::json claims{
		{"userId",      body.value("userId", std::string{"anonymous"})},
		{"permissions", body.value("permissions", nlohmann::json::array({"read"}))},
		{"type",        "access"}
	};

	auto res = json_response({
		{"token",     m_ctx.tokens.issue(std::move(claims))},
		{"type",      "Bearer"},
		{"expiresIn", m_ctx.tokens.ttl().count()}
	}, req.version());
	res.set(http::field::cache_control, no_cache);
	return res;
}

StringResponse RequestHandler::list_videos(unsigned version) const
{
	auto videos = nlohmann::json::array();
	for (auto&& [id, meta] : m_ctx.metadata.list())
	{
		auto thumbnail = thumbnail_url(id, meta);
		videos.push_back({
			{"id",                  id},
			{"title",               meta.title},
			{"duration",            meta.duration},
			{"formattedDuration",   format_duration(meta.duration)},
			{"thumbnail",           thumbnail ? nlohmann::json(*thumbnail) : nlohmann::json()},
			{"qualities",           meta.qualities}
		});
	}

	auto total = videos.size();
	auto res = json_response({{"videos", std::move(videos)}, {"total", total}}, version);
	res.set(http::field::cache_control, m_ctx.cfg.cache().header(false));
	return res;
}

StringResponse RequestHandler::video_metadata(const std::string& video_id, unsigned version) const
{
	auto meta = m_ctx.metadata.load(video_id);

	auto qualities = nlohmann::json::array();
	for (auto&& q : meta.qualities)
	{
		auto res = meta.resolutions.find(q);
		auto bit = meta.bitrates.find(q);
		qualities.push_back({
			{"name",        q},
			{"resolution",  res != meta.resolutions.end() ? res->second : q},
			{"bitrate",     bit != meta.bitrates.end() ? nlohmann::json(bit->second) : nlohmann::json()}
		});
	}

	auto& def = m_ctx.resolver.default_quality();
	auto thumbnail = thumbnail_url(video_id, meta);

	auto res = json_response({
		{"id",                  video_id},
		{"title",               meta.title},
		{"description",         meta.description},
		{"duration",            meta.duration},
		{"formattedDuration",   format_duration(meta.duration)},
		{"chunkDuration",       meta.chunk_duration},
		{"totalChunks",         meta.total_chunks},
		{"qualities",           std::move(qualities)},
		{"defaultQuality",      meta.has_quality(def) ? nlohmann::json(def) :
			(meta.qualities.empty() ? nlohmann::json() : nlohmann::json(meta.qualities.front()))},
		{"thumbnail",           thumbnail ? nlohmann::json(*thumbnail) : nlohmann::json()},
		{"createdAt",           meta.created_at}
	}, version);
	res.set(http::field::cache_control, m_ctx.cfg.cache().header(false));
	return res;
}

StringResponse RequestHandler::manifest(const std::string& video_id, const RequestTarget& target, unsigned version) const
{
	auto manifest = m_ctx.resolver.manifest(
		video_id,
		target.option("quality").value_or(""),
		m_ctx.cfg.enable_auth() ? &m_ctx.grants : nullptr,
		m_ctx.cfg.signed_url_expiry()
	);

	auto res = json_response(manifest, version);

	// signed URLs expire so the manifest must not outlive them in caches
	res.set(
		http::field::cache_control,
		m_ctx.cfg.enable_auth() ? no_cache : m_ctx.cfg.cache().header(false)
	);
	return res;
}

StringResponse RequestHandler::signed_urls(const std::string& video_id, const RequestTarget& target, unsigned version) const
{
	auto quality = target.option("quality").value_or(m_ctx.cfg.default_quality());
	if (quality.empty())
		quality = m_ctx.cfg.default_quality();

	auto start   = int_option(target, "start", 0);
	auto count   = int_option(target, "count", 10);
	auto expires = int_option(target, "expiresIn", m_ctx.cfg.signed_url_expiry().count());
	if (start < 0 || count < 0 || expires <= 0)
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{"start and count must not be negative and expiresIn must be positive"}
			<< VideoID{video_id}
		);

	auto meta = m_ctx.metadata.load(video_id);
	count = std::max<std::int64_t>(0, std::min(count, meta.total_chunks - start));

	auto urls = nlohmann::json::array();
	for (auto&& grant : m_ctx.grants.issue_batch(
		video_id, quality, start, static_cast<std::size_t>(count), std::chrono::seconds{expires}
	))
	{
		urls.push_back({
			{"chunkIndex",  grant.index},
			{"url",         chunk_url(video_id, quality, grant.index) + "?" + grant.query()},
			{"expires",     grant.expires}
		});
	}

	auto res = json_response({
		{"videoId",     video_id},
		{"quality",     quality},
		{"signedUrls",  std::move(urls)}
	}, version);
	res.set(http::field::cache_control, no_cache);
	return res;
}

http::response<MMapResponseBody> RequestHandler::thumbnail(const std::string& video_id, unsigned version) const
{
	std::error_code ec;
	auto file = MMap::open(m_ctx.metadata.locator().thumbnail_path(video_id), ec);
	if (ec || !file.is_opened())
		BOOST_THROW_EXCEPTION(VideoNotFound()
			<< Message{"Thumbnail not found"}
			<< VideoID{video_id}
			<< ErrorCode{ec}
		);

	auto size = file.size();
	http::response<MMapResponseBody> res{
		std::piecewise_construct,
		std::make_tuple(MMapView{std::move(file), 0, size}),
		std::make_tuple(http::status::ok, version)
	};
	res.set(http::field::content_type, "image/jpeg");
	res.set(http::field::cache_control, m_ctx.cfg.cache().header(false));
	return res;
}

StringResponse RequestHandler::upload(UploadRequest&& req, const RequestTarget& target)
{
	auto& file = req.body();

	boost::system::error_code ec;
	auto size = boost::filesystem::file_size(file.path(), ec);
	if (ec || size == 0)
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"No video file uploaded"});

	IngestOptions options;
	options.title       = target.option("title").value_or("");
	options.description = target.option("description").value_or("");
	options.qualities   = split_list(target.option("qualities").value_or(""));

	auto filename = target.option("filename").value_or("upload");
	auto sub = m_ctx.ingest.submit_upload(std::move(file), filename, options);

	Log(LOG_INFO, "upload of %1% bytes (%2%) queued as job %3%", size, filename, sub.job_id);
	return json_response(submission_json(sub, "Video upload processing started"), req.version(), http::status::accepted);
}

StringResponse RequestHandler::from_url(const StringRequest& req)
{
	auto body = parse_json_body(req);
	auto url = string_field(body, "url");
	if (url.empty())
		BOOST_THROW_EXCEPTION(ValidationError() << Message{"Video URL is required"});

	IngestOptions options;
	options.title       = string_field(body, "title");
	options.description = string_field(body, "description");
	options.qualities   = quality_list(body);

	auto sub = m_ctx.ingest.submit_url(url, options);
	return json_response(submission_json(sub, "Video processing started"), req.version(), http::status::accepted);
}

StringResponse RequestHandler::list_jobs(unsigned version) const
{
	auto jobs = m_ctx.jobs.list(m_ctx.cfg.job_list_limit());
	auto total = jobs.size();

	auto res = json_response({{"jobs", std::move(jobs)}, {"total", total}}, version);
	res.set(http::field::cache_control, no_cache);
	return res;
}

StringResponse RequestHandler::get_job(const std::string& job_id, unsigned version) const
{
	auto job = m_ctx.jobs.get(job_id);
	if (!job)
		return not_found("Job not found", version);

	auto res = json_response(*job, version);
	res.set(http::field::cache_control, no_cache);
	return res;
}

StringResponse RequestHandler::delete_job(const std::string& job_id, unsigned version)
{
	if (!m_ctx.ingest.cancel(job_id))
		return not_found("Job not found", version);

	Log(LOG_NOTICE, "job %1% deleted", job_id);
	return json_response({{"jobId", job_id}, {"message", "Job deleted"}}, version);
}

StringResponse RequestHandler::chunk_range(
	const std::string& video_id, const std::string& quality,
	const RequestTarget& target, unsigned version
) const
{
	// no more than this many chunks per listing
	const std::int64_t max_count = 20;

	auto start = int_option(target, "start", 0);
	auto count = int_option(target, "count", 5);
	if (start < 0 || count < 0)
		BOOST_THROW_EXCEPTION(ValidationError()
			<< Message{"start and count must not be negative"}
			<< VideoID{video_id}
		);

	auto chunks = m_ctx.resolver.chunk_range(
		video_id, quality, start, static_cast<std::size_t>(std::min(count, max_count))
	);
	return json_response({
		{"videoId", video_id},
		{"quality", quality},
		{"start",   start},
		{"chunks",  chunks}
	}, version);
}

EmptyResponse RequestHandler::chunk_by_time(
	const std::string& video_id, const std::string& quality,
	std::string_view time, const RequestTarget& target, unsigned version
) const
{
	auto chunk = m_ctx.resolver.resolve_by_timestamp(video_id, quality, parse_timestamp(time));

	// The grant is verified when the client follows the redirect
	auto location = chunk_url(video_id, quality, chunk.index);
	if (!target.query().empty())
		location += "?" + std::string{target.query()};

	EmptyResponse res{http::status::temporary_redirect, version};
	res.set(http::field::location, location);
	res.set("X-Chunk-Index", std::to_string(chunk.index));
	res.set(http::field::cache_control, no_cache);
	return res;
}

} // end of namespace cot
