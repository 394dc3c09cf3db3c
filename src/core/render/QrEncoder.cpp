#include "QrEncoder.hpp"

#include <qrcodegen.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "core/image/Raster.hpp"

namespace certgen {

std::string verification_payload(const std::string& baseUrl, const std::string& certNo) {
  if (baseUrl.empty()) return certNo;
  std::string base = baseUrl;
  while (!base.empty() && base.back() == '/') base.pop_back();
  std::size_t start = 0;
  while (start < certNo.size() && certNo[start] == '/') ++start;
  return base + "/" + certNo.substr(start);
}

Result<ImageBytes> QrEncoder::encode(const std::string& payload) const {
  if (payload.empty()) {
    return Result<ImageBytes>::fail(ErrorCode::EncodingError, "QR payload must not be empty");
  }

  try {
    const qrcodegen::QrCode qr =
      qrcodegen::QrCode::encodeText(payload.c_str(), qrcodegen::QrCode::Ecc::MEDIUM);

    const int modules = qr.getSize() + 2 * kQuietZone;
    const int dim = modules * kModulePixels;
    std::vector<std::uint8_t> gray(static_cast<std::size_t>(dim) * dim, 0xFF);
    for (int my = 0; my < qr.getSize(); ++my) {
      for (int mx = 0; mx < qr.getSize(); ++mx) {
        if (!qr.getModule(mx, my)) continue;
        const int px = (mx + kQuietZone) * kModulePixels;
        const int py = (my + kQuietZone) * kModulePixels;
        for (int dy = 0; dy < kModulePixels; ++dy) {
          std::uint8_t* row = &gray[static_cast<std::size_t>(py + dy) * dim + px];
          std::fill(row, row + kModulePixels, std::uint8_t{0});
        }
      }
    }

    ImageBytes out;
    out.png = encode_png_gray(dim, dim, gray);
    out.width = dim;
    out.height = dim;
    spdlog::debug("QR version {} ({}x{} px) for {} chars", qr.getVersion(), dim, dim, payload.size());
    return out;
  } catch (const std::exception& e) {
    return Result<ImageBytes>::fail(ErrorCode::EncodingError,
                                    std::string("QR encoding failed: ") + e.what());
  }
}

} // namespace certgen
