#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>

#include "core/image/ImageNormalizer.hpp"
#include "test_helpers.hpp"

using namespace certgen;
using namespace test_helpers;

namespace {

// Solid-colour RGB JPEG through libjpeg's memory destination.
Bytes make_jpeg(int width, int height) {
  jpeg_compress_struct cinfo;
  jpeg_error_mgr jerr;
  cinfo.err = jpeg_std_error(&jerr);
  jpeg_create_compress(&cinfo);

  unsigned char* mem = nullptr;
  unsigned long memSize = 0;
  jpeg_mem_dest(&cinfo, &mem, &memSize);

  cinfo.image_width = static_cast<JDIMENSION>(width);
  cinfo.image_height = static_cast<JDIMENSION>(height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, 90, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  std::vector<unsigned char> row(static_cast<std::size_t>(width) * 3);
  for (int x = 0; x < width; ++x) {
    row[x * 3] = 200;
    row[x * 3 + 1] = 30;
    row[x * 3 + 2] = 30;
  }
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW rp = row.data();
    jpeg_write_scanlines(&cinfo, &rp, 1);
  }
  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);

  Bytes out(mem, mem + memSize);
  std::free(mem);
  return out;
}

} // namespace

TEST(FitWithin, SmallImageUnchanged) {
  EXPECT_EQ(fit_within(50, 50, 800, 300), std::make_pair(50, 50));
  EXPECT_EQ(fit_within(800, 300, 800, 300), std::make_pair(800, 300));
}

TEST(FitWithin, WideImageLimitedByWidth) {
  EXPECT_EQ(fit_within(2000, 100, 800, 300), std::make_pair(800, 40));
}

TEST(FitWithin, TallImageLimitedByHeight) {
  EXPECT_EQ(fit_within(1000, 1000, 800, 300), std::make_pair(300, 300));
  EXPECT_EQ(fit_within(100, 3000, 800, 300), std::make_pair(10, 300));
}

TEST(FitWithin, NeverCollapsesToZero) {
  auto [w, h] = fit_within(10000, 1, 800, 300);
  EXPECT_EQ(w, 800);
  EXPECT_GE(h, 1);
}

TEST(ImageNormalizer, SmallPngKeepsSize) {
  ImageNormalizer n;
  auto out = n.normalize(make_png(50, 50), kSignatureMaxWidth, kSignatureMaxHeight);
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.value().width, 50);
  EXPECT_EQ(out.value().height, 50);
  int w = 0, h = 0;
  ASSERT_TRUE(read_png_size(out.value().png, w, h));
  EXPECT_EQ(w, 50);
  EXPECT_EQ(h, 50);
}

TEST(ImageNormalizer, WidePngIsBoundedAndKeepsAspect) {
  ImageNormalizer n;
  auto out = n.normalize(make_png(2000, 100), 800, 300);
  ASSERT_TRUE(out.ok());
  EXPECT_LE(out.value().width, 800);
  EXPECT_LE(out.value().height, 300);
  const double aspect = static_cast<double>(out.value().width) / out.value().height;
  EXPECT_NEAR(aspect, 20.0, 0.5);
}

TEST(ImageNormalizer, DownscalePreservesSolidColourAndAlpha) {
  ImageNormalizer n;
  auto out = n.normalize(make_png(400, 400, 10, 20, 30, 128), 100, 100);
  ASSERT_TRUE(out.ok());
  RgbaImage img = decode_image(out.value().png);
  ASSERT_EQ(img.width, 100);
  ASSERT_EQ(img.height, 100);
  const std::size_t mid = (50 * 100 + 50) * 4;
  EXPECT_NEAR(img.pixels[mid], 10, 1);
  EXPECT_NEAR(img.pixels[mid + 1], 20, 1);
  EXPECT_NEAR(img.pixels[mid + 2], 30, 1);
  EXPECT_NEAR(img.pixels[mid + 3], 128, 1);
}

TEST(ImageNormalizer, JpegBecomesOpaquePng) {
  ImageNormalizer n;
  auto out = n.normalize(make_jpeg(1600, 600), 800, 300);
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(sniff_format(out.value().png), RasterFormat::Png);
  EXPECT_EQ(out.value().width, 800);
  EXPECT_EQ(out.value().height, 300);
  RgbaImage img = decode_image(out.value().png);
  EXPECT_EQ(img.pixels[3], 255);
}

TEST(ImageNormalizer, UndecodableBytesFail) {
  ImageNormalizer n;
  auto out = n.normalize(to_bytes("definitely not an image"), 800, 300);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::UnsupportedImageFormat);

  // valid signature, truncated body
  Bytes png = make_png(20, 20);
  png.resize(40);
  auto truncated = n.normalize(png, 800, 300);
  ASSERT_FALSE(truncated.ok());
  EXPECT_EQ(truncated.error().code, ErrorCode::UnsupportedImageFormat);
}

TEST(ImageNormalizer, JpegMissingEndMarkerDecodesQuietly) {
  Bytes jpeg = make_jpeg(64, 32);
  ASSERT_GT(jpeg.size(), 2u);
  jpeg.resize(jpeg.size() - 2);  // drop EOI

  ImageNormalizer n;
  testing::internal::CaptureStderr();
  auto out = n.normalize(jpeg, 800, 300);
  const std::string err = testing::internal::GetCapturedStderr();
  ASSERT_TRUE(out.ok()) << out.error().message;
  EXPECT_EQ(out.value().width, 64);
  EXPECT_EQ(out.value().height, 32);
  EXPECT_EQ(err, "");
}

TEST(ImageNormalizer, GarbledJpegFails) {
  Bytes jpeg = {0xFF, 0xD8, 0xFF, 0x00, 0x13, 0x37, 0x00, 0x01, 0x02, 0x03};
  ImageNormalizer n;
  testing::internal::CaptureStderr();
  auto out = n.normalize(jpeg, 800, 300);
  const std::string err = testing::internal::GetCapturedStderr();
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::UnsupportedImageFormat);
  EXPECT_NE(out.error().message.find("JPEG"), std::string::npos);
  EXPECT_EQ(err, "");
}

TEST(ImageNormalizer, NonPositiveBoundsRejected) {
  ImageNormalizer n;
  auto out = n.normalize(make_png(10, 10), 0, 300);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().code, ErrorCode::Validation);
}
