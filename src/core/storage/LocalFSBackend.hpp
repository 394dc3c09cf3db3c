#pragma once
#include <filesystem>
#include <string>

#include "ObjectStore.hpp"

namespace certgen {

// Object store rooted in a local directory; keys map to relative paths.
class LocalFSBackend : public ObjectStore {
public:
  explicit LocalFSBackend(std::string root)
    : root_(std::move(root)) {}

  Result<AssetBlob> get(const std::string& key) override;

  // Writes to a temporary sibling then renames over the target.
  Status put(const std::string& key,
             const Bytes& data,
             const std::string& contentType) override;

  std::string describe() const override { return "local:" + root_; }

private:
  // Empty path when the key escapes the root.
  std::filesystem::path resolve(const std::string& key) const;

  std::string root_;
};

} // namespace certgen
