#include "AwsSigV4.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <cctype>
#include <stdexcept>

namespace certgen::sigv4 {

static std::string to_hex(const unsigned char* data, std::size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

static std::string hmac_raw(const std::string& key, const std::string& msg) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int outLen = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
            out, &outLen)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<char*>(out), outLen);
}

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string sha256_hex(const void* data, std::size_t len) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  unsigned int mdLen = 0;
  if (EVP_Digest(data, len, md, &mdLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return to_hex(md, mdLen);
}

std::string uri_encode(const std::string& in, bool encodeSlash) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size() * 3);
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (c == '/' && !encodeSlash)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[c >> 4]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

std::string amz_date(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

static std::string signed_header_list(const HeaderMap& headers) {
  std::string out;
  for (const auto& [name, value] : headers) {
    (void)value;
    if (!out.empty()) out += ';';
    out += name;
  }
  return out;
}

std::string canonical_request(const std::string& method,
                              const std::string& canonicalUri,
                              const std::string& canonicalQuery,
                              const HeaderMap& headers,
                              const std::string& payloadHash) {
  std::string req = method + "\n" + canonicalUri + "\n" + canonicalQuery + "\n";
  for (const auto& [name, value] : headers) {
    req += name + ":" + trim(value) + "\n";
  }
  req += "\n" + signed_header_list(headers) + "\n" + payloadHash;
  return req;
}

std::string authorization(const std::string& method,
                          const std::string& canonicalUri,
                          const std::string& canonicalQuery,
                          const HeaderMap& headers,
                          const std::string& payloadHash,
                          const Scope& scope,
                          const Credentials& creds) {
  auto it = headers.find("x-amz-date");
  if (it == headers.end() || it->second.size() < 8) {
    throw std::invalid_argument("x-amz-date header required for SigV4");
  }
  const std::string& date = it->second;
  const std::string day = date.substr(0, 8);
  const std::string credentialScope =
    day + "/" + scope.region + "/" + scope.service + "/aws4_request";

  const std::string creq =
    canonical_request(method, canonicalUri, canonicalQuery, headers, payloadHash);
  const std::string stringToSign =
    "AWS4-HMAC-SHA256\n" + date + "\n" + credentialScope + "\n" + sha256_hex(creq);

  std::string key = hmac_raw("AWS4" + creds.secretAccessKey, day);
  key = hmac_raw(key, scope.region);
  key = hmac_raw(key, scope.service);
  key = hmac_raw(key, "aws4_request");
  const std::string sig = hmac_raw(key, stringToSign);

  return "AWS4-HMAC-SHA256 Credential=" + creds.accessKeyId + "/" + credentialScope +
         ",SignedHeaders=" + signed_header_list(headers) +
         ",Signature=" + to_hex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());
}

} // namespace certgen::sigv4
