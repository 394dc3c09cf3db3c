#pragma once
#include <string>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"

namespace certgen {

// Key-addressed blob store. One instance is shared by all request workers,
// so implementations must be safe for concurrent use.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // Fails with AssetNotFound or AssetStoreUnavailable.
  virtual Result<AssetBlob> get(const std::string& key) = 0;

  // Overwrites silently. Fails with AssetStoreUnavailable.
  virtual Status put(const std::string& key,
                     const Bytes& data,
                     const std::string& contentType) = 0;

  virtual std::string describe() const = 0;
};

} // namespace certgen
