#include "rest_api_handler.hpp"
#include "interface/job_json.hpp"

#include <stdexcept>

namespace clip_service {

namespace {

constexpr int kEstimatedSeconds = 30;

std::string stringField(const nlohmann::json &body, const char *name,
                        const std::string &fallback = "") {
  auto it = body.find(name);
  if (it == body.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string("Field '") + name + "' must be a string");
  }
  return it->get<std::string>();
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<ClipService> clip_service,
                               common::CorsPolicy cors,
                               std::filesystem::path public_dir)
    : RestApiHandlerBase(std::move(cors)),
      clip_service_(std::move(clip_service)),
      public_dir_(std::move(public_dir)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto target = common::parseTarget(std::string(req.target()));
  const auto &path = target.path;

  if (req.method() == http::verb::get) {
    if (path == "/health") {
      return createJsonResponse(http::status::ok, {{"ok", true}});
    } else if (path == "/favicon.ico") {
      return http::response<http::string_body>{http::status::no_content, 11};
    } else if (path == "/api/history") {
      return handleHistory();
    } else if (path == "/api/download/status") {
      return handleStatus(target);
    } else if (path.starts_with("/api/")) {
      return createErrorResponse(http::status::not_found, "Endpoint not found", "NOT_FOUND");
    }
    return createFileResponse(public_dir_, path);
  }

  if (req.method() == http::verb::post) {
    auto body = parseRequestBody(std::string(req.body()));
    if (!body.is_object()) {
      throw std::invalid_argument("Request body must be a JSON object");
    }
    if (path == "/api/parse") {
      return handleParse(body);
    } else if (path == "/api/download") {
      return handleDownload(body);
    } else if (path == "/api/download/cancel") {
      return handleCancel(body);
    }
  }

  return createErrorResponse(http::status::not_found, "Endpoint not found", "NOT_FOUND");
}

http::response<http::string_body>
RestApiHandler::handleParse(const nlohmann::json &body) {
  auto url = stringField(body, "url");
  auto parsed = clip_service_->parseSource(url);
  if (!parsed) {
    return createErrorResponse(http::status::bad_request, parsed.error().message, "BAD_URL");
  }
  return createJsonResponse(http::status::ok, {{"platform", parsed->platform},
                                               {"resourceId", parsed->resource_id}});
}

http::response<http::string_body>
RestApiHandler::handleDownload(const nlohmann::json &body) {
  DownloadRequest request;
  request.url = stringField(body, "url");
  request.type = stringField(body, "type", "video");
  request.quality = stringField(body, "quality", "1080p");
  request.platform = stringField(body, "platform");
  request.resource_id = stringField(body, "resourceId");

  if (request.url.empty()) {
    return createErrorResponse(http::status::bad_request, "url is required", "BAD_REQ");
  }
  if (!ClipService::isValidSourceUrl(request.url)) {
    return createErrorResponse(http::status::bad_request, "A valid http(s) URL is required",
                               "BAD_URL");
  }

  auto job_id = clip_service_->submitDownload(request);
  if (!job_id) {
    return createJobErrorResponse(job_id.error());
  }
  return createJsonResponse(http::status::ok, {{"jobId", *job_id},
                                               {"estimatedSec", kEstimatedSeconds}});
}

http::response<http::string_body>
RestApiHandler::handleStatus(const common::RequestTarget &target) {
  auto it = target.query.find("jobId");
  if (it == target.query.end()) {
    return createErrorResponse(http::status::not_found, "job not found", "NOT_FOUND");
  }
  auto job = clip_service_->getJob(it->second);
  if (!job) {
    return createJobErrorResponse(job.error());
  }
  return createJsonResponse(http::status::ok, jobToJson(*job));
}

http::response<http::string_body>
RestApiHandler::handleCancel(const nlohmann::json &body) {
  auto job_id = stringField(body, "jobId");
  if (job_id.empty()) {
    return createErrorResponse(http::status::bad_request, "jobId is required", "BAD_REQ");
  }
  auto cancelled = clip_service_->cancelJob(job_id);
  if (!cancelled) {
    if (cancelled.error().kind == ErrorKind::InvalidInput) {
      return createErrorResponse(http::status::conflict, cancelled.error().message,
                                 "JOB_FINISHED");
    }
    return createJobErrorResponse(cancelled.error());
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"jobId", job_id}});
}

http::response<http::string_body> RestApiHandler::handleHistory() {
  auto items = nlohmann::json::array();
  for (const auto &entry : clip_service_->listHistory()) {
    items.push_back(historyEntryToJson(entry));
  }
  return createJsonResponse(http::status::ok, {{"items", items}});
}

http::response<http::string_body>
RestApiHandler::createJobErrorResponse(const JobError &error) {
  switch (error.kind) {
  case ErrorKind::InvalidInput:
    return createErrorResponse(http::status::bad_request, error.message, "BAD_REQ");
  case ErrorKind::Configuration:
    return createErrorResponse(http::status::internal_server_error, error.message, "CONFIG");
  case ErrorKind::NotFound:
    return createErrorResponse(http::status::not_found, error.message, "NOT_FOUND");
  case ErrorKind::QueueFull:
    return createErrorResponse(http::status::service_unavailable, error.message, "QUEUE_FULL");
  default:
    return createErrorResponse(http::status::internal_server_error, error.message, "INTERNAL");
  }
}

} // namespace clip_service
