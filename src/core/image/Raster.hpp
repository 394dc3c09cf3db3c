#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "core/common/Types.hpp"

namespace certgen {

// 8-bit straight-alpha RGBA, row-major, no padding.
struct RgbaImage {
  int width  = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels;
};

enum class RasterFormat { Png, Jpeg, Unknown };

RasterFormat sniff_format(const Bytes& data);

// Decodes PNG or JPEG into RGBA. Throws std::runtime_error on failure.
RgbaImage decode_image(const Bytes& data);

// Lossless re-encode; output is deterministic for identical input.
Bytes encode_png(const RgbaImage& img);
Bytes encode_png_gray(int width, int height, const std::vector<std::uint8_t>& gray);

// Reads IHDR without decoding. False when `data` is not a PNG.
bool read_png_size(const Bytes& data, int& width, int& height);

} // namespace certgen
