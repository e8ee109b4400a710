#include "rest_api_handler_base.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace common {

namespace {

const char* mimeType(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
  if (ext == ".css") return "text/css; charset=utf-8";
  if (ext == ".js") return "application/javascript";
  if (ext == ".json") return "application/json";
  if (ext == ".png") return "image/png";
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  if (ext == ".svg") return "image/svg+xml";
  if (ext == ".ico") return "image/vnd.microsoft.icon";
  if (ext == ".txt") return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}

bool CorsPolicy::allows(std::string_view origin) const {
  if (allow_all || origin.empty()) {
    return true;
  }
  return std::find(origins.begin(), origins.end(), origin) != origins.end();
}

std::string urlDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '+') {
      out.push_back(' ');
    } else if (in[i] == '%' && i + 2 < in.size() &&
               hexValue(in[i + 1]) >= 0 && hexValue(in[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hexValue(in[i + 1]) * 16 + hexValue(in[i + 2])));
      i += 2;
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

RequestTarget parseTarget(std::string_view target) {
  RequestTarget result;
  auto qpos = target.find('?');
  result.path = std::string(target.substr(0, qpos));
  if (qpos == std::string_view::npos) {
    return result;
  }

  auto query = target.substr(qpos + 1);
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = urlDecode(pair.substr(0, eq));
      auto value = eq == std::string_view::npos ? std::string{} : urlDecode(pair.substr(eq + 1));
      result.query.emplace(std::move(key), std::move(value));
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return result;
}

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message, const std::string& code) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  if (!code.empty()) {
    error_json["code"] = code;
  }
  return createJsonResponse(status, error_json);
}

http::response<http::string_body> RestApiHandlerBase::createFileResponse(
  const std::filesystem::path& root, std::string_view request_path) {

  auto relative = urlDecode(request_path);
  while (!relative.empty() && relative.front() == '/') {
    relative.erase(relative.begin());
  }
  if (relative.empty() || relative.back() == '/') {
    relative += "index.html";
  }

  std::filesystem::path candidate = std::filesystem::path(relative).lexically_normal();
  if (candidate.is_absolute() || (!candidate.empty() && *candidate.begin() == "..")) {
    return createErrorResponse(http::status::bad_request, "Illegal request target", "BAD_PATH");
  }

  auto full_path = root / candidate;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(full_path, ec)) {
    return createErrorResponse(http::status::not_found, "Endpoint not found", "NOT_FOUND");
  }

  std::ifstream in(full_path, std::ios::binary);
  if (!in) {
    return createErrorResponse(http::status::not_found, "Endpoint not found", "NOT_FOUND");
  }
  std::ostringstream content;
  content << in.rdbuf();

  http::response<http::string_body> res{http::status::ok, 11};
  res.set(http::field::content_type, mimeType(full_path));
  res.body() = content.str();
  res.prepare_payload();
  return res;
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

void RestApiHandlerBase::addCorsHeaders(http::response<http::string_body>& res,
                                        const std::string& origin) const {
  if (cors_.allow_all) {
    res.set(http::field::access_control_allow_origin, "*");
  } else if (!origin.empty() && cors_.allows(origin)) {
    res.set(http::field::access_control_allow_origin, origin);
    res.set(http::field::vary, "Origin");
  }
  res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

}
