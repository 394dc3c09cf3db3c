#include "ImageNormalizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace certgen {

// Picks floor or ceil of `number`, whichever scores lower; at least 1.
template <typename Key>
static int round_aspect(double number, Key key) {
  const double lo = std::floor(number);
  const double hi = std::ceil(number);
  const double best = key(hi) < key(lo) ? hi : lo;
  return std::max(static_cast<int>(best), 1);
}

std::pair<int, int> fit_within(int width, int height, int maxWidth, int maxHeight) {
  if (width <= maxWidth && height <= maxHeight) return {width, height};

  int x = maxWidth;
  int y = maxHeight;
  const double aspect = static_cast<double>(width) / height;
  if (static_cast<double>(x) / y >= aspect) {
    x = round_aspect(y * aspect, [&](double n) { return std::abs(aspect - n / y); });
  } else {
    y = round_aspect(x / aspect, [&](double n) {
      return n == 0 ? 0.0 : std::abs(aspect - x / n);
    });
  }
  if (x >= width && y >= height) return {width, height};
  return {x, y};
}

namespace {

struct Tap {
  int    src;
  double weight;
};

// Coverage of each source sample by each output sample, normalized.
std::vector<std::vector<Tap>> area_taps(int srcLen, int dstLen) {
  std::vector<std::vector<Tap>> taps(dstLen);
  const double scale = static_cast<double>(srcLen) / dstLen;
  for (int i = 0; i < dstLen; ++i) {
    const double start = i * scale;
    const double end = std::min((i + 1) * scale, static_cast<double>(srcLen));
    const int first = static_cast<int>(std::floor(start));
    const int last = std::min(static_cast<int>(std::ceil(end)), srcLen);
    double total = 0.0;
    for (int s = first; s < last; ++s) {
      const double w = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
      if (w > 0.0) {
        taps[i].push_back({s, w});
        total += w;
      }
    }
    for (auto& t : taps[i]) t.weight /= total;
  }
  return taps;
}

} // namespace

RgbaImage downscale(const RgbaImage& src, int width, int height) {
  if (width == src.width && height == src.height) return src;

  const std::size_t sw = static_cast<std::size_t>(src.width);
  const std::size_t sh = static_cast<std::size_t>(src.height);

  // premultiply
  std::vector<double> pm(sw * sh * 4);
  for (std::size_t i = 0; i < sw * sh; ++i) {
    const double a = src.pixels[i * 4 + 3] / 255.0;
    pm[i * 4 + 0] = src.pixels[i * 4 + 0] * a;
    pm[i * 4 + 1] = src.pixels[i * 4 + 1] * a;
    pm[i * 4 + 2] = src.pixels[i * 4 + 2] * a;
    pm[i * 4 + 3] = src.pixels[i * 4 + 3];
  }

  const auto hx = area_taps(src.width, width);
  const auto vy = area_taps(src.height, height);

  std::vector<double> horiz(static_cast<std::size_t>(width) * sh * 4, 0.0);
  for (std::size_t y = 0; y < sh; ++y) {
    for (int x = 0; x < width; ++x) {
      double* d = &horiz[(y * width + x) * 4];
      for (const Tap& t : hx[x]) {
        const double* s = &pm[(y * sw + t.src) * 4];
        for (int c = 0; c < 4; ++c) d[c] += s[c] * t.weight;
      }
    }
  }

  RgbaImage out;
  out.width = width;
  out.height = height;
  out.pixels.resize(static_cast<std::size_t>(width) * height * 4);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      double acc[4] = {0.0, 0.0, 0.0, 0.0};
      for (const Tap& t : vy[y]) {
        const double* s = &horiz[(static_cast<std::size_t>(t.src) * width + x) * 4];
        for (int c = 0; c < 4; ++c) acc[c] += s[c] * t.weight;
      }
      std::uint8_t* d = &out.pixels[(static_cast<std::size_t>(y) * width + x) * 4];
      const double a = acc[3];
      for (int c = 0; c < 3; ++c) {
        const double v = a > 0.0 ? acc[c] * 255.0 / a : 0.0;
        d[c] = static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
      }
      d[3] = static_cast<std::uint8_t>(std::clamp(std::lround(a), 0L, 255L));
    }
  }
  return out;
}

Result<ImageBytes> ImageNormalizer::normalize(const Bytes& raw, int maxWidth, int maxHeight) const {
  if (maxWidth <= 0 || maxHeight <= 0) {
    return Result<ImageBytes>::fail(ErrorCode::Validation, "image bounds must be positive");
  }

  RgbaImage img;
  try {
    img = decode_image(raw);
  } catch (const std::exception& e) {
    return Result<ImageBytes>::fail(ErrorCode::UnsupportedImageFormat,
                                    std::string("cannot decode image: ") + e.what());
  }
  if (img.width <= 0 || img.height <= 0) {
    return Result<ImageBytes>::fail(ErrorCode::UnsupportedImageFormat, "image has no pixels");
  }

  const auto [w, h] = fit_within(img.width, img.height, maxWidth, maxHeight);
  if (w != img.width || h != img.height) {
    spdlog::debug("downscaling image {}x{} -> {}x{}", img.width, img.height, w, h);
    img = downscale(img, w, h);
  }

  try {
    ImageBytes out;
    out.png = encode_png(img);
    out.width = img.width;
    out.height = img.height;
    return out;
  } catch (const std::exception& e) {
    return Result<ImageBytes>::fail(ErrorCode::UnsupportedImageFormat,
                                    std::string("cannot re-encode image: ") + e.what());
  }
}

} // namespace certgen
