#pragma once
#include <string>

#include "ObjectStore.hpp"

namespace certgen {

// Single-attempt read of a named asset (template, signature image).
class AssetFetcher {
public:
  explicit AssetFetcher(ObjectStore& store) : store_(store) {}

  Result<AssetBlob> fetch(const std::string& key) const;

private:
  ObjectStore& store_;
};

// Final write of the pipeline output. Overwrites; no retry.
class ArtifactPublisher {
public:
  explicit ArtifactPublisher(ObjectStore& store) : store_(store) {}

  Status publish(const std::string& key,
                 const Bytes& data,
                 const std::string& contentType) const;

private:
  ObjectStore& store_;
};

} // namespace certgen
