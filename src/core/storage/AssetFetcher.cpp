#include "AssetFetcher.hpp"

#include <spdlog/spdlog.h>

namespace certgen {

Result<AssetBlob> AssetFetcher::fetch(const std::string& key) const {
  if (key.empty()) {
    return Result<AssetBlob>::fail(ErrorCode::Validation, "asset key must not be empty");
  }
  auto blob = store_.get(key);
  if (!blob) {
    spdlog::warn("fetch {} failed [{}]: {}", key, to_string(blob.error().code), blob.error().message);
    return blob;
  }
  spdlog::debug("fetched {} ({} bytes)", key, blob.value().data.size());
  return blob;
}

Status ArtifactPublisher::publish(const std::string& key,
                                  const Bytes& data,
                                  const std::string& contentType) const {
  if (key.empty()) {
    return Status::fail(ErrorCode::PublishError, "artifact key must not be empty");
  }
  auto st = store_.put(key, data, contentType);
  if (!st) {
    spdlog::error("publish {} failed: {}", key, st.error().message);
    return Status::fail(ErrorCode::PublishError, st.error().message);
  }
  spdlog::info("published {} ({} bytes, {})", key, data.size(), contentType);
  return {};
}

} // namespace certgen
