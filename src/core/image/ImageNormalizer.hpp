#pragma once
#include <utility>

#include "Raster.hpp"
#include "core/common/Result.hpp"

namespace certgen {

inline constexpr int kSignatureMaxWidth  = 800;
inline constexpr int kSignatureMaxHeight = 300;

// Largest size inside maxWidth x maxHeight with the source aspect ratio.
// Returns the source size when it already fits (never upscales).
std::pair<int, int> fit_within(int width, int height, int maxWidth, int maxHeight);

// Area-averaging downscale in premultiplied alpha.
RgbaImage downscale(const RgbaImage& src, int width, int height);

class ImageNormalizer {
public:
  // Decode -> RGBA -> bounded downscale -> PNG.
  Result<ImageBytes> normalize(const Bytes& raw, int maxWidth, int maxHeight) const;
};

} // namespace certgen
