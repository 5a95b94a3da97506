#include "Image.hpp"
#include "Log.hpp"

#include <fstream>
#include <ostream>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace prism {

bool write_ppm(std::ostream &out, const Image &image) {
  out << "P3\n" << image.width() << ' ' << image.height() << "\n255\n";
  for (u32 y = 0; y < image.height(); ++y) {
    for (u32 x = 0; x < image.width(); ++x) {
      const u8 *pixel = image.pixel_data(x, y);
      out << i32(pixel[0]) << ' ' << i32(pixel[1]) << ' ' << i32(pixel[2])
          << '\n';
    }
  }
  out.flush();
  return bool(out);
}

bool write_ppm(const std::filesystem::path &image_path, const Image &image) {
  std::ofstream file(image_path);
  if (!file) {
    PERROR("Failed to open file: {}", image_path.string());
    return false;
  }
  if (!write_ppm(file, image)) {
    PERROR("Failed to write to file: {}", image_path.string());
    return false;
  }
  return true;
}

bool write_png(const std::filesystem::path &image_path, const Image &image) {
  if (!stbi_write_png(image_path.string().c_str(), i32(image.width()),
                      i32(image.height()), channel_num, image.pixels(),
                      i32(image.width() * channel_num))) {
    PERROR("Failed to write to file: {}", image_path.string());
    return false;
  }
  return true;
}

} // namespace prism
