#include "Camera.hpp"
#include "Assert.hpp"
#include "Color.hpp"
#include "Log.hpp"
#include "Material.hpp"

#include <ostream>

namespace prism {

Camera::Camera(const CameraConfig &config)
    : image_width(config.image_width),
      samples_per_pixel(config.samples_per_pixel),
      max_depth(config.max_depth), defocus_angle(config.defocus_angle),
      center(config.lookfrom) {
  PASSERT_MSG(samples_per_pixel > 0, "Camera needs at least one sample");
  PASSERT_MSG(image_width > 0, "Camera needs a non-zero image width");

  f64 height = f64(image_width) / config.aspect_ratio;
  if (!(height >= 1.0))
    image_height = 1;
  else if (height > f64(u32_max))
    image_height = u32_max;
  else
    image_height = u32(height);

  pixel_samples_scale = real(1) / samples_per_pixel;

  // Determine viewport dimensions.
  real theta = degrees_to_radians(config.vfov);
  real h = std::tan(theta / 2.f);
  real viewport_height = 2.f * h * config.focus_dist;
  real viewport_width = viewport_height * (real(image_width) / image_height);

  // Calculate the u,v,w unit basis vectors for the camera coordinate frame.
  w = unit_vector(config.lookfrom - config.lookat);
  u = unit_vector(cross(config.vup, w));
  v = cross(w, u);

  // Calculate the vectors across the horizontal and down the vertical
  // viewport edges.
  Vec3 viewport_u = viewport_width * u;   // Vector across viewport horizontal edge
  Vec3 viewport_v = viewport_height * -v; // Vector down viewport vertical edge

  // Calculate the horizontal and vertical delta vectors from pixel to pixel.
  pixel_delta_u = viewport_u / (real)image_width;
  pixel_delta_v = viewport_v / (real)image_height;

  // Calculate the location of the upper left pixel.
  Vec3 viewport_upper_left =
      center - (config.focus_dist * w) - viewport_u / 2.f - viewport_v / 2.f;
  pixel00_loc = viewport_upper_left + 0.5f * (pixel_delta_u + pixel_delta_v);

  // Calculate the camera defocus disk basis vectors.
  real defocus_radius =
      config.focus_dist * std::tan(degrees_to_radians(defocus_angle / 2.f));
  defocus_disk_u = u * defocus_radius;
  defocus_disk_v = v * defocus_radius;
}

void Camera::render(const Hittable &world, Random &rng,
                    std::ostream &out) const {
  out << "P3\n" << image_width << ' ' << image_height << "\n255\n";

  for (u32 j = 0; j < image_height; j++) {
    PINFO("Scanlines remaining: {}", image_height - j);
    for (u32 i = 0; i < image_width; i++) {
      write_color(out, sample_pixel(i, j, world, rng));
    }
  }
  PINFO("Done.");
}

void Camera::render(const Hittable &world, Random &rng, u8 *out_pixels) const {
  u32 index = 0;

  for (u32 j = 0; j < image_height; j++) {
    PINFO("Scanlines remaining: {}", image_height - j);
    for (u32 i = 0; i < image_width; i++) {
      i32 ir, ig, ib;
      color_to_bytes(sample_pixel(i, j, world, rng), ir, ig, ib);

      out_pixels[index++] = u8(ir);
      out_pixels[index++] = u8(ig);
      out_pixels[index++] = u8(ib);
    }
  }
  PINFO("Done.");
}

Color Camera::sample_pixel(i32 i, i32 j, const Hittable &world,
                           Random &rng) const {
  Color pixel_color = Color(0.f, 0.f, 0.f);
  for (u32 sample = 0; sample < samples_per_pixel; ++sample) {
    Ray ray = get_ray(i, j, rng);
    pixel_color += ray_color(ray, max_depth, world, rng);
  }
  return pixel_samples_scale * pixel_color;
}

Color Camera::ray_color(const Ray &r, u32 depth, const Hittable &world,
                        Random &rng) const {
  // Each bounce multiplies the running attenuation; running out of depth
  // contributes no light.
  Color throughput(1.f, 1.f, 1.f);
  Ray current = r;

  for (; depth > 0; --depth) {
    HitRecord rec;
    if (!world.hit(current, Interval(0.001f, infinity), rec)) {
      Vec3 unit_direction = unit_vector(current.direction());
      real a = 0.5f * (unit_direction.y() + 1.f);
      return throughput *
             ((1.f - a) * Color(1.f, 1.f, 1.f) + a * Color(0.5f, 0.7f, 1.f));
    }

    PASSERT_MSG(rec.mat, "Hit record without a material");
    Ray scattered;
    Color attenuation;
    if (!rec.mat->scatter_ray(current, rec, attenuation, scattered, rng)) {
      return Color(0.f, 0.f, 0.f);
    }
    throughput = throughput * attenuation;
    current = scattered;
  }

  return Color(0.f, 0.f, 0.f);
}

Vec3 Camera::sample_square(Random &rng) const {
  // Returns the vector to a random point in the [-.5,-.5]-[+.5,+.5] unit
  // square.
  return Vec3(rng.uniform() - 0.5f, rng.uniform() - 0.5f, 0.f);
}

Point3 Camera::defocus_disk_sample(Random &rng) const {
  // Returns a random point in the camera defocus disk.
  Vec3 p = random_in_unit_disk(rng);
  return center + (p[0] * defocus_disk_u) + (p[1] * defocus_disk_v);
}

Ray Camera::get_ray(i32 i, i32 j, Random &rng) const {
  // Construct a camera ray originating from the defocus disk and directed at
  // a randomly sampled point around the pixel location i, j.

  Vec3 offset = sample_square(rng);
  Vec3 pixel_sample = pixel00_loc + ((i + offset.x()) * pixel_delta_u) +
                      ((j + offset.y()) * pixel_delta_v);

  Vec3 ray_origin = (defocus_angle <= 0) ? center : defocus_disk_sample(rng);
  Vec3 ray_direction = pixel_sample - ray_origin;

  return Ray(ray_origin, ray_direction);
}

} // namespace prism
