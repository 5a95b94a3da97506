#ifndef COLOR_H
#define COLOR_H

#include "Interval.hpp"
#include "Vec3.hpp"

#include <iostream>

namespace prism {

// Gamma corrects a linear color and quantizes each channel to [0,255].
inline void color_to_bytes(const Color &pixel_color, i32 &ir, i32 &ig,
                           i32 &ib) {
  static const Interval intensity(0.f, 0.999f);

  real r = linear_to_gamma(pixel_color.x());
  real g = linear_to_gamma(pixel_color.y());
  real b = linear_to_gamma(pixel_color.z());

  ir = i32(256 * intensity.clamp(r));
  ig = i32(256 * intensity.clamp(g));
  ib = i32(256 * intensity.clamp(b));
}

inline void write_color(std::ostream &out, const Color &pixel_color) {
  i32 ir, ig, ib;
  color_to_bytes(pixel_color, ir, ig, ib);
  out << ir << ' ' << ig << ' ' << ib << '\n';
}

} // namespace prism

#endif
