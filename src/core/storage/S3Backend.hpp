#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "AwsSigV4.hpp"
#include "ObjectStore.hpp"

typedef void CURL;

namespace certgen {

struct S3Options {
  std::string endpoint;   // https://<account>.r2.cloudflarestorage.com
  std::string bucket;
  std::string region = "auto";
  std::string accessKeyId;
  std::string secretAccessKey;
  long        timeoutSeconds = 30;
};

// Path-style S3 client (GET/PUT object) signed with SigV4. Built once at
// start-up and shared; curl easy handles are pooled so connections are
// reused across requests.
class S3Backend : public ObjectStore {
public:
  explicit S3Backend(S3Options opts);
  ~S3Backend() override;

  S3Backend(const S3Backend&) = delete;
  S3Backend& operator=(const S3Backend&) = delete;

  Result<AssetBlob> get(const std::string& key) override;
  Status put(const std::string& key,
             const Bytes& data,
             const std::string& contentType) override;

  std::string describe() const override { return "s3:" + opts_.endpoint + "/" + opts_.bucket; }

private:
  class HandleLease;

  CURL* acquire();
  void release(CURL* h);

  std::string canonicalUri(const std::string& key) const;

  S3Options   opts_;
  std::string host_;

  std::mutex         mu_;
  std::vector<CURL*> idle_;
};

} // namespace certgen
