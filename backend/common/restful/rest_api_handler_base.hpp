#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

struct CorsPolicy {
  bool allow_all{true};
  std::vector<std::string> origins;

  // Requests without an Origin header are same-origin and always allowed.
  bool allows(std::string_view origin) const;
};

struct RequestTarget {
  std::string path;
  std::map<std::string, std::string> query;
};

// Splits "/path?a=1&b=x%20y" into its path and decoded query parameters.
RequestTarget parseTarget(std::string_view target);
std::string urlDecode(std::string_view in);

class RestApiHandlerBase {
public:
  explicit RestApiHandlerBase(CorsPolicy cors = {}) : cors_(std::move(cors)) {}
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto origin = std::string(req[http::field::origin]);
    auto keep_alive = req.keep_alive();
    auto version = req.version();

    auto finish = [&](http::response<http::string_body> res) {
      res.version(version);
      res.keep_alive(keep_alive);
      addCorsHeaders(res, origin);
      res.prepare_payload();
      return res;
    };

    if (!cors_.allows(origin)) {
      return finish(createErrorResponse(http::status::forbidden, "CORS blocked", "CORS_BLOCKED"));
    }

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::no_content, version};
      return finish(std::move(res));
    }

    try {
      return finish(doHandleRequest(std::move(req)));
    } catch (const std::invalid_argument& e) {
      return finish(createErrorResponse(http::status::bad_request, e.what(), "BAD_REQ"));
    } catch (const std::exception& e) {
      return finish(createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()),
                                        "INTERNAL"));
    }
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message, const std::string& code = "");

  // Serves a file below root; rejects paths escaping it.
  http::response<http::string_body> createFileResponse(
    const std::filesystem::path& root, std::string_view request_path);

  nlohmann::json parseRequestBody(const std::string& body);

private:
  void addCorsHeaders(http::response<http::string_body>& res, const std::string& origin) const;

  CorsPolicy cors_;
};

}
