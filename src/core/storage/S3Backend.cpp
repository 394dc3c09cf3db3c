#include "S3Backend.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace certgen {

// ---------- curl helpers ----------

static size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<Bytes*>(userdata);
  out->insert(out->end(), ptr, ptr + size * nmemb);
  return size * nmemb;
}

struct HeaderList {
  curl_slist* list = nullptr;
  ~HeaderList() { if (list) curl_slist_free_all(list); }
  void add(const std::string& line) {
    curl_slist* next = curl_slist_append(list, line.c_str());
    if (!next) throw std::runtime_error("curl_slist_append failed");
    list = next;
  }
};

static std::string body_snippet(const Bytes& body) {
  const size_t n = std::min<size_t>(body.size(), 300);
  return std::string(body.begin(), body.begin() + static_cast<long>(n));
}

// Returns the lease's handle to the pool on scope exit.
class S3Backend::HandleLease {
public:
  explicit HandleLease(S3Backend& owner) : owner_(owner), h_(owner.acquire()) {}
  ~HandleLease() { owner_.release(h_); }
  CURL* get() const { return h_; }
private:
  S3Backend& owner_;
  CURL* h_;
};

// ---------- S3Backend ----------

S3Backend::S3Backend(S3Options opts) : opts_(std::move(opts)) {
  while (!opts_.endpoint.empty() && opts_.endpoint.back() == '/') opts_.endpoint.pop_back();
  const auto schemeEnd = opts_.endpoint.find("://");
  if (schemeEnd == std::string::npos) {
    throw std::invalid_argument("S3 endpoint must include a scheme: " + opts_.endpoint);
  }
  host_ = opts_.endpoint.substr(schemeEnd + 3);
  if (auto slash = host_.find('/'); slash != std::string::npos) host_.resize(slash);
  if (opts_.bucket.empty()) throw std::invalid_argument("S3 bucket not set");
}

S3Backend::~S3Backend() {
  std::lock_guard<std::mutex> lk(mu_);
  for (CURL* h : idle_) curl_easy_cleanup(h);
  idle_.clear();
}

CURL* S3Backend::acquire() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!idle_.empty()) {
      CURL* h = idle_.back();
      idle_.pop_back();
      return h;
    }
  }
  CURL* h = curl_easy_init();
  if (!h) throw std::runtime_error("curl_easy_init failed");
  return h;
}

void S3Backend::release(CURL* h) {
  // reset clears options but keeps the connection cache
  curl_easy_reset(h);
  std::lock_guard<std::mutex> lk(mu_);
  idle_.push_back(h);
}

std::string S3Backend::canonicalUri(const std::string& key) const {
  return "/" + sigv4::uri_encode(opts_.bucket, true) + "/" + sigv4::uri_encode(key, false);
}

Result<AssetBlob> S3Backend::get(const std::string& key) {
  const std::string uri = canonicalUri(key);
  const std::string url = opts_.endpoint + uri;

  sigv4::HeaderMap signedHeaders = {
    {"host", host_},
    {"x-amz-content-sha256", sigv4::kEmptyPayloadHash},
    {"x-amz-date", sigv4::amz_date(std::time(nullptr))},
  };

  try {
    const std::string auth = sigv4::authorization(
      "GET", uri, "", signedHeaders, sigv4::kEmptyPayloadHash,
      {opts_.region, "s3"}, {opts_.accessKeyId, opts_.secretAccessKey});

    HeaderList headers;
    for (const auto& [name, value] : signedHeaders) headers.add(name + ": " + value);
    headers.add("Authorization: " + auth);

    HandleLease lease(*this);
    CURL* h = lease.get();
    Bytes body;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, opts_.timeoutSeconds);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      return Result<AssetBlob>::fail(ErrorCode::AssetStoreUnavailable,
        "GET " + key + " failed: " + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status == 404) {
      return Result<AssetBlob>::fail(ErrorCode::AssetNotFound, "no such object: " + key);
    }
    if (status != 200) {
      return Result<AssetBlob>::fail(ErrorCode::AssetStoreUnavailable,
        "GET " + key + " returned HTTP " + std::to_string(status) + ": " + body_snippet(body));
    }

    AssetBlob blob;
    blob.data = std::move(body);
    char* ct = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
      blob.content_type = ct;
    } else {
      blob.content_type = "application/octet-stream";
    }
    spdlog::debug("s3 get {} ({} bytes)", key, blob.data.size());
    return blob;
  } catch (const std::exception& e) {
    return Result<AssetBlob>::fail(ErrorCode::AssetStoreUnavailable,
      "GET " + key + " failed: " + e.what());
  }
}

Status S3Backend::put(const std::string& key,
                      const Bytes& data,
                      const std::string& contentType) {
  const std::string uri = canonicalUri(key);
  const std::string url = opts_.endpoint + uri;

  try {
    const std::string payloadHash = sigv4::sha256_hex(data.data(), data.size());
    sigv4::HeaderMap signedHeaders = {
      {"content-type", contentType},
      {"host", host_},
      {"x-amz-content-sha256", payloadHash},
      {"x-amz-date", sigv4::amz_date(std::time(nullptr))},
    };
    const std::string auth = sigv4::authorization(
      "PUT", uri, "", signedHeaders, payloadHash,
      {opts_.region, "s3"}, {opts_.accessKeyId, opts_.secretAccessKey});

    HeaderList headers;
    for (const auto& [name, value] : signedHeaders) headers.add(name + ": " + value);
    headers.add("Authorization: " + auth);
    headers.add("Expect:");

    HandleLease lease(*this);
    CURL* h = lease.get();
    Bytes body;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
    // a null POSTFIELDS makes curl fall back to its read callback
    curl_easy_setopt(h, CURLOPT_POSTFIELDS,
                     data.empty() ? "" : reinterpret_cast<const char*>(data.data()));
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(data.size()));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, opts_.timeoutSeconds);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      return Status::fail(ErrorCode::AssetStoreUnavailable,
        "PUT " + key + " failed: " + curl_easy_strerror(rc));
    }
    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
      return Status::fail(ErrorCode::AssetStoreUnavailable,
        "PUT " + key + " returned HTTP " + std::to_string(status) + ": " + body_snippet(body));
    }
    spdlog::debug("s3 put {} ({} bytes, {})", key, data.size(), contentType);
    return {};
  } catch (const std::exception& e) {
    return Status::fail(ErrorCode::AssetStoreUnavailable, "PUT " + key + " failed: " + e.what());
  }
}

} // namespace certgen
