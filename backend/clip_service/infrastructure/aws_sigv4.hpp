#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clip_service {

struct AwsCredentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryList = std::vector<std::pair<std::string, std::string>>;

// AWS Signature Version 4 for a single service/region pair.
class SigV4Signer {
public:
  static constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

  SigV4Signer(AwsCredentials credentials, std::string region, std::string service = "s3");

  // Returns the headers to attach to the request: x-amz-date,
  // x-amz-content-sha256, x-amz-security-token (when a session token is
  // set) and Authorization. `headers` must not include them.
  HeaderList signHeaders(
    std::string_view method,
    std::string_view host,
    std::string_view canonical_uri,
    const QueryList& query,
    const HeaderList& headers,
    std::string_view payload_hash,
    std::chrono::system_clock::time_point now
  ) const;

  // Returns the query string (without '?') of a presigned request.
  std::string presignQuery(
    std::string_view method,
    std::string_view host,
    std::string_view canonical_uri,
    std::chrono::seconds expires,
    std::chrono::system_clock::time_point now
  ) const;

  static std::string sha256Hex(std::string_view data);
  static std::string uriEncode(std::string_view in, bool encode_slash);
  static std::string canonicalQuery(const QueryList& query);
  static std::string amzDate(std::chrono::system_clock::time_point tp);

private:
  std::string credentialScope(const std::string& date) const;
  std::string signature(const std::string& date, const std::string& string_to_sign) const;
  std::string stringToSign(const std::string& amz_date, const std::string& scope,
                           const std::string& canonical_request) const;

  AwsCredentials credentials_;
  std::string region_;
  std::string service_;
};

} // namespace clip_service
