#pragma once
#include <string>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"

namespace certgen {

// Joins base and certificate number with exactly one '/'. An empty base
// yields the certificate number itself.
std::string verification_payload(const std::string& baseUrl, const std::string& certNo);

class QrEncoder {
public:
  static constexpr int kModulePixels = 10;
  static constexpr int kQuietZone = 4;

  // Same payload, same bytes. Fails with EncodingError on empty payload.
  Result<ImageBytes> encode(const std::string& payload) const;
};

} // namespace certgen
