#include "png_codec.hpp"
#include <png.h>
#include <cstring>

// far above any 16:9 page; a header claiming more is treated as corrupt
static constexpr size_t kMaxDecodedPixels = 8192u * 8192u;

bool decode_png(const std::string& bytes, PixelGrid& out, std::string& msg) {
  if (bytes.empty()) { msg = "empty payload"; return false; }
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
    msg = std::string("not a png image: ") + image.message;
    png_image_free(&image);
    return false;
  }
  if (static_cast<size_t>(image.width) * image.height > kMaxDecodedPixels) {
    msg = "image too large: " + std::to_string(image.width) + "x" + std::to_string(image.height);
    png_image_free(&image);
    return false;
  }
  image.format = PNG_FORMAT_RGB;
  PixelGrid grid(static_cast<int>(image.width), static_cast<int>(image.height));
  png_color black{0, 0, 0};
  // finish_read releases the decoder whether or not it succeeds
  if (!png_image_finish_read(&image, &black, grid.rgb.data(), 0, nullptr)) {
    msg = std::string("corrupt png data: ") + image.message;
    png_image_free(&image);
    return false;
  }
  out = std::move(grid);
  return true;
}

bool encode_png(const PixelGrid& image, std::string& out, std::string& msg) {
  if (image.empty()) { msg = "empty image"; return false; }
  png_image info;
  std::memset(&info, 0, sizeof(info));
  info.version = PNG_IMAGE_VERSION;
  info.width = static_cast<png_uint_32>(image.width);
  info.height = static_cast<png_uint_32>(image.height);
  info.format = PNG_FORMAT_RGB;
  png_alloc_size_t size = 0;
  if (!png_image_write_get_memory_size(info, size, 0, image.rgb.data(), 0, nullptr)) {
    msg = std::string("png encode: ") + info.message;
    png_image_free(&info);
    return false;
  }
  out.resize(size);
  if (!png_image_write_to_memory(&info, &out[0], &size, 0, image.rgb.data(), 0, nullptr)) {
    msg = std::string("png encode: ") + info.message;
    png_image_free(&info);
    out.clear();
    return false;
  }
  out.resize(size);
  return true;
}
