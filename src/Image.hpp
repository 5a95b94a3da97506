#pragma once

#include "Defines.hpp"

#include <filesystem>
#include <iosfwd>
#include <vector>

namespace prism {

constexpr u32 channel_num = 3;

// RGB8 pixel buffer filled by Camera::render.
class Image {
public:
  Image(u32 width, u32 height)
      : image_width(width), image_height(height),
        bdata(size_t(width) * height * channel_num, 0) {}

  u32 width() const { return image_width; }
  u32 height() const { return image_height; }

  u8 *pixels() { return bdata.data(); }
  const u8 *pixels() const { return bdata.data(); }

  const u8 *pixel_data(u32 x, u32 y) const {
    return bdata.data() + (size_t(y) * image_width + x) * channel_num;
  }

private:
  u32 image_width = 0;
  u32 image_height = 0;
  std::vector<u8> bdata;
};

// Writes the plain-text P3 raster: header followed by one pixel per line.
bool write_ppm(std::ostream &out, const Image &image);
bool write_ppm(const std::filesystem::path &image_path, const Image &image);

bool write_png(const std::filesystem::path &image_path, const Image &image);

} // namespace prism
