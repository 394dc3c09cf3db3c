#include "Raster.hpp"

#include <png.h>
#include <jpeglib.h>
#include <spdlog/spdlog.h>

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace certgen {

static const unsigned char kPngSig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

RasterFormat sniff_format(const Bytes& data) {
  if (data.size() >= 8 && std::memcmp(data.data(), kPngSig, 8) == 0) return RasterFormat::Png;
  if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) return RasterFormat::Jpeg;
  return RasterFormat::Unknown;
}

bool read_png_size(const Bytes& data, int& width, int& height) {
  // signature(8) + length(4) + "IHDR"(4) + width(4) + height(4)
  if (data.size() < 24 || sniff_format(data) != RasterFormat::Png) return false;
  if (std::memcmp(data.data() + 12, "IHDR", 4) != 0) return false;
  auto be32 = [&](std::size_t off) {
    return (static_cast<std::uint32_t>(data[off]) << 24) |
           (static_cast<std::uint32_t>(data[off + 1]) << 16) |
           (static_cast<std::uint32_t>(data[off + 2]) << 8) |
            static_cast<std::uint32_t>(data[off + 3]);
  };
  width = static_cast<int>(be32(16));
  height = static_cast<int>(be32(20));
  return width > 0 && height > 0;
}

// ---------- PNG ----------

static RgbaImage decode_png(const Bytes& data) {
  png_image img;
  std::memset(&img, 0, sizeof(img));
  img.version = PNG_IMAGE_VERSION;
  if (!png_image_begin_read_from_memory(&img, data.data(), data.size())) {
    throw std::runtime_error(std::string("PNG header: ") + img.message);
  }
  img.format = PNG_FORMAT_RGBA;

  RgbaImage out;
  out.width = static_cast<int>(img.width);
  out.height = static_cast<int>(img.height);
  out.pixels.resize(PNG_IMAGE_SIZE(img));
  if (!png_image_finish_read(&img, nullptr, out.pixels.data(), 0, nullptr)) {
    std::string msg = img.message;
    png_image_free(&img);
    throw std::runtime_error("PNG decode: " + msg);
  }
  return out;
}

static Bytes write_png(png_image& img, const void* buffer) {
  png_alloc_size_t size = 0;
  if (!png_image_write_to_memory(&img, nullptr, &size, 0, buffer, 0, nullptr)) {
    throw std::runtime_error(std::string("PNG encode: ") + img.message);
  }
  Bytes out(size);
  if (!png_image_write_to_memory(&img, out.data(), &size, 0, buffer, 0, nullptr)) {
    throw std::runtime_error(std::string("PNG encode: ") + img.message);
  }
  out.resize(size);
  return out;
}

Bytes encode_png(const RgbaImage& src) {
  png_image img;
  std::memset(&img, 0, sizeof(img));
  img.version = PNG_IMAGE_VERSION;
  img.width = static_cast<png_uint_32>(src.width);
  img.height = static_cast<png_uint_32>(src.height);
  img.format = PNG_FORMAT_RGBA;
  return write_png(img, src.pixels.data());
}

Bytes encode_png_gray(int width, int height, const std::vector<std::uint8_t>& gray) {
  png_image img;
  std::memset(&img, 0, sizeof(img));
  img.version = PNG_IMAGE_VERSION;
  img.width = static_cast<png_uint_32>(width);
  img.height = static_cast<png_uint_32>(height);
  img.format = PNG_FORMAT_GRAY;
  return write_png(img, gray.data());
}

// ---------- JPEG ----------

struct JpegErrorMgr {
  jpeg_error_mgr pub;
  std::jmp_buf   jump;
  char           message[JMSG_LENGTH_MAX];
};

static void jpeg_error_exit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

// Corrupt-data warnings; the default handler writes to stderr.
static void jpeg_output_message(j_common_ptr cinfo) {
  char buf[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, buf);
  spdlog::debug("libjpeg: {}", buf);
}

// Everything written between setjmp and a longjmp lives here, outside the
// frame that calls setjmp.
struct JpegDecodeState {
  jpeg_decompress_struct cinfo;
  JpegErrorMgr           jerr;
  RgbaImage              out;
  std::vector<std::uint8_t> row;
  bool                   cmyk = false;
};

static bool run_jpeg_decode(const Bytes& data, JpegDecodeState& st) {
  st.cinfo.err = jpeg_std_error(&st.jerr.pub);
  st.jerr.pub.error_exit = jpeg_error_exit;
  st.jerr.pub.output_message = jpeg_output_message;
  st.jerr.message[0] = '\0';

  if (setjmp(st.jerr.jump)) {
    jpeg_destroy_decompress(&st.cinfo);
    return false;
  }

  jpeg_create_decompress(&st.cinfo);
  jpeg_mem_src(&st.cinfo, const_cast<unsigned char*>(data.data()),
               static_cast<unsigned long>(data.size()));
  jpeg_read_header(&st.cinfo, TRUE);
  if (st.cinfo.jpeg_color_space == JCS_CMYK || st.cinfo.jpeg_color_space == JCS_YCCK) {
    st.cmyk = true;
    jpeg_destroy_decompress(&st.cinfo);
    return false;
  }
  st.cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&st.cinfo);

  st.out.width = static_cast<int>(st.cinfo.output_width);
  st.out.height = static_cast<int>(st.cinfo.output_height);
  st.out.pixels.resize(static_cast<std::size_t>(st.out.width) * st.out.height * 4);
  st.row.resize(static_cast<std::size_t>(st.out.width) * 3);

  while (st.cinfo.output_scanline < st.cinfo.output_height) {
    const std::size_t y = st.cinfo.output_scanline;
    JSAMPROW rowPtr = st.row.data();
    jpeg_read_scanlines(&st.cinfo, &rowPtr, 1);
    std::uint8_t* dst = st.out.pixels.data() + y * st.out.width * 4;
    for (int x = 0; x < st.out.width; ++x) {
      dst[x * 4 + 0] = st.row[x * 3 + 0];
      dst[x * 4 + 1] = st.row[x * 3 + 1];
      dst[x * 4 + 2] = st.row[x * 3 + 2];
      dst[x * 4 + 3] = 0xFF;
    }
  }

  jpeg_finish_decompress(&st.cinfo);
  jpeg_destroy_decompress(&st.cinfo);
  return true;
}

static RgbaImage decode_jpeg(const Bytes& data) {
  JpegDecodeState st;
  if (!run_jpeg_decode(data, st)) {
    if (st.cmyk) throw std::runtime_error("JPEG decode: CMYK images are not supported");
    throw std::runtime_error(std::string("JPEG decode: ") + st.jerr.message);
  }
  return std::move(st.out);
}

RgbaImage decode_image(const Bytes& data) {
  switch (sniff_format(data)) {
    case RasterFormat::Png:  return decode_png(data);
    case RasterFormat::Jpeg: return decode_jpeg(data);
    case RasterFormat::Unknown: break;
  }
  throw std::runtime_error("unrecognized image format");
}

} // namespace certgen
