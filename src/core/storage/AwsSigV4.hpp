#pragma once
#include <ctime>
#include <map>
#include <string>

namespace certgen::sigv4 {

struct Credentials {
  std::string accessKeyId;
  std::string secretAccessKey;
};

struct Scope {
  std::string region;   // "auto" for R2
  std::string service;  // "s3"
};

// Header names must be lower case; values are trimmed when canonicalized.
using HeaderMap = std::map<std::string, std::string>;

inline constexpr const char* kEmptyPayloadHash =
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string sha256_hex(const void* data, std::size_t len);
inline std::string sha256_hex(const std::string& s) { return sha256_hex(s.data(), s.size()); }

// RFC 3986 encoding as S3 expects it; '/' kept unless encodeSlash.
std::string uri_encode(const std::string& in, bool encodeSlash);

// "20130524T000000Z"
std::string amz_date(std::time_t t);

std::string canonical_request(const std::string& method,
                              const std::string& canonicalUri,
                              const std::string& canonicalQuery,
                              const HeaderMap& headers,
                              const std::string& payloadHash);

// Value for the Authorization header. `headers` must already contain
// host, x-amz-date and x-amz-content-sha256.
std::string authorization(const std::string& method,
                          const std::string& canonicalUri,
                          const std::string& canonicalQuery,
                          const HeaderMap& headers,
                          const std::string& payloadHash,
                          const Scope& scope,
                          const Credentials& creds);

} // namespace certgen::sigv4
