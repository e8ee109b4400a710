#pragma once
#include "application/clip_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>

namespace clip_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<ClipService> clip_service,
                 common::CorsPolicy cors,
                 std::filesystem::path public_dir);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<ClipService> clip_service_;
  std::filesystem::path public_dir_;

  http::response<http::string_body> handleParse(const nlohmann::json &body);
  http::response<http::string_body> handleDownload(const nlohmann::json &body);
  http::response<http::string_body> handleStatus(const common::RequestTarget &target);
  http::response<http::string_body> handleCancel(const nlohmann::json &body);
  http::response<http::string_body> handleHistory();

  http::response<http::string_body> createJobErrorResponse(const JobError &error);
};

} // namespace clip_service
