#include "aws_sigv4.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace clip_service {

namespace {

constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";

std::string toHex(const unsigned char* data, std::size_t len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0f]);
  }
  return out;
}

std::string hmacSha256(std::string_view key, std::string_view data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(out), len);
}

std::string lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Trims and collapses inner whitespace runs, as the canonical form requires.
std::string canonicalValue(std::string_view in) {
  std::string out;
  bool pending_space = false;
  for (char c : in) {
    if (c == ' ' || c == '\t') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

}

SigV4Signer::SigV4Signer(AwsCredentials credentials, std::string region, std::string service)
  : credentials_(std::move(credentials)), region_(std::move(region)), service_(std::move(service)) {}

std::string SigV4Signer::sha256Hex(std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr)) {
    throw std::runtime_error("SHA-256 failed");
  }
  return toHex(digest, len);
}

std::string SigV4Signer::uriEncode(std::string_view in, bool encode_slash) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size() * 3);
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (c == '/' && !encode_slash)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string SigV4Signer::canonicalQuery(const QueryList& query) {
  std::vector<std::pair<std::string, std::string>> encoded;
  encoded.reserve(query.size());
  for (const auto& [key, value] : query) {
    encoded.emplace_back(uriEncode(key, true), uriEncode(value, true));
  }
  std::sort(encoded.begin(), encoded.end());

  std::string out;
  for (const auto& [key, value] : encoded) {
    if (!out.empty()) out += '&';
    out += key;
    out += '=';
    out += value;
  }
  return out;
}

std::string SigV4Signer::amzDate(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[17];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

std::string SigV4Signer::credentialScope(const std::string& date) const {
  return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::stringToSign(const std::string& amz_date, const std::string& scope,
                                      const std::string& canonical_request) const {
  return std::string(kAlgorithm) + "\n" + amz_date + "\n" + scope + "\n" +
         sha256Hex(canonical_request);
}

std::string SigV4Signer::signature(const std::string& date,
                                   const std::string& string_to_sign) const {
  auto k_date = hmacSha256("AWS4" + credentials_.secret_access_key, date);
  auto k_region = hmacSha256(k_date, region_);
  auto k_service = hmacSha256(k_region, service_);
  auto k_signing = hmacSha256(k_service, "aws4_request");
  auto sig = hmacSha256(k_signing, string_to_sign);
  return toHex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());
}

HeaderList SigV4Signer::signHeaders(
    std::string_view method,
    std::string_view host,
    std::string_view canonical_uri,
    const QueryList& query,
    const HeaderList& headers,
    std::string_view payload_hash,
    std::chrono::system_clock::time_point now) const {

  auto amz_date = amzDate(now);
  auto date = amz_date.substr(0, 8);

  HeaderList added = {
    {"x-amz-date", amz_date},
    {"x-amz-content-sha256", std::string(payload_hash)},
  };
  if (!credentials_.session_token.empty()) {
    added.emplace_back("x-amz-security-token", credentials_.session_token);
  }

  std::vector<std::pair<std::string, std::string>> canonical;
  canonical.emplace_back("host", std::string(host));
  for (const auto& [name, value] : headers) {
    canonical.emplace_back(lower(name), canonicalValue(value));
  }
  for (const auto& [name, value] : added) {
    canonical.emplace_back(name, value);
  }
  std::sort(canonical.begin(), canonical.end());

  std::string canonical_headers;
  std::string signed_headers;
  for (const auto& [name, value] : canonical) {
    canonical_headers += name + ":" + value + "\n";
    if (!signed_headers.empty()) signed_headers += ';';
    signed_headers += name;
  }

  auto canonical_request = std::string(method) + "\n" +
                           std::string(canonical_uri) + "\n" +
                           canonicalQuery(query) + "\n" +
                           canonical_headers + "\n" +
                           signed_headers + "\n" +
                           std::string(payload_hash);

  auto scope = credentialScope(date);
  auto sig = signature(date, stringToSign(amz_date, scope, canonical_request));

  added.emplace_back("Authorization",
                     std::string(kAlgorithm) + " Credential=" + credentials_.access_key_id + "/" +
                     scope + ",SignedHeaders=" + signed_headers + ",Signature=" + sig);
  return added;
}

std::string SigV4Signer::presignQuery(
    std::string_view method,
    std::string_view host,
    std::string_view canonical_uri,
    std::chrono::seconds expires,
    std::chrono::system_clock::time_point now) const {

  auto amz_date = amzDate(now);
  auto date = amz_date.substr(0, 8);
  auto scope = credentialScope(date);

  QueryList query = {
    {"X-Amz-Algorithm", std::string(kAlgorithm)},
    {"X-Amz-Credential", credentials_.access_key_id + "/" + scope},
    {"X-Amz-Date", amz_date},
    {"X-Amz-Expires", std::to_string(expires.count())},
    {"X-Amz-SignedHeaders", "host"},
  };
  if (!credentials_.session_token.empty()) {
    query.emplace_back("X-Amz-Security-Token", credentials_.session_token);
  }

  auto canonical_query = canonicalQuery(query);
  auto canonical_request = std::string(method) + "\n" +
                           std::string(canonical_uri) + "\n" +
                           canonical_query + "\n" +
                           "host:" + std::string(host) + "\n\n" +
                           "host\n" +
                           std::string(kUnsignedPayload);

  auto sig = signature(date, stringToSign(amz_date, scope, canonical_request));
  return canonical_query + "&X-Amz-Signature=" + sig;
}

} // namespace clip_service
