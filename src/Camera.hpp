#ifndef CAMERA_H
#define CAMERA_H

#include "Defines.hpp"
#include "Hittable.hpp"
#include "Random.hpp"
#include "Vec3.hpp"

#include <iosfwd>

namespace prism {

struct CameraConfig {
  real aspect_ratio = 1.f;     // Ratio of image width over height
  u32 image_width = 100;       // Rendered image width in pixel count
  u32 samples_per_pixel = 10;  // Count of random samples for each pixel
  u32 max_depth = 10;          // Maximum number of ray bounces into scene
  real vfov = 90.f;            // Vertical view angle (field of view)

  Point3 lookfrom = Point3(0.f, 0.f, 0.f); // Point camera is looking from
  Point3 lookat = Point3(0.f, 0.f, -1.f);  // Point camera is looking at
  Vec3 vup = Vec3(0.f, 1.f, 0.f);          // Camera-relative "up" direction

  real defocus_angle = 0.f; // Variation angle of rays through each pixel
  real focus_dist = 10.f;   // Distance from lookfrom to plane of perfect focus
};

class Camera {
public:
  explicit Camera(const CameraConfig &config);

  // Streams a P3 image: header, then one "r g b" line per pixel.
  void render(const Hittable &world, Random &rng, std::ostream &out) const;

  // Fills out_pixels with image_width * image_height RGB byte triples.
  void render(const Hittable &world, Random &rng, u8 *out_pixels) const;

  Ray get_ray(i32 i, i32 j, Random &rng) const;

  Color ray_color(const Ray &r, u32 depth, const Hittable &world,
                  Random &rng) const;

  u32 get_image_width() const { return image_width; }
  u32 get_image_height() const { return image_height; }
  const Point3 &get_center() const { return center; }
  const Point3 &get_pixel00_loc() const { return pixel00_loc; }
  const Vec3 &get_pixel_delta_u() const { return pixel_delta_u; }
  const Vec3 &get_pixel_delta_v() const { return pixel_delta_v; }
  const Vec3 &get_defocus_disk_u() const { return defocus_disk_u; }
  const Vec3 &get_defocus_disk_v() const { return defocus_disk_v; }

private:
  Color sample_pixel(i32 i, i32 j, const Hittable &world, Random &rng) const;
  Vec3 sample_square(Random &rng) const;
  Point3 defocus_disk_sample(Random &rng) const;

private:
  u32 image_width;
  u32 image_height;
  u32 samples_per_pixel;
  u32 max_depth;
  real pixel_samples_scale; // Color scale factor for a sum of pixel samples
  real defocus_angle;
  Point3 center;            // Camera center
  Point3 pixel00_loc;       // Location of pixel 0, 0
  Vec3 pixel_delta_u;       // Offset to pixel to the right
  Vec3 pixel_delta_v;       // Offset to pixel below
  Vec3 u, v, w;             // Camera frame basis vectors
  Vec3 defocus_disk_u;      // Defocus disk horizontal radius
  Vec3 defocus_disk_v;      // Defocus disk vertical radius
};

} // namespace prism

#endif
