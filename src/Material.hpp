#ifndef MATERIAL_H
#define MATERIAL_H

#include "Hittable.hpp"
#include "Random.hpp"

namespace prism {

class Material {
public:
  virtual ~Material() = default;

  // Returns false when the ray is absorbed.
  virtual bool scatter_ray(const Ray &r_in, const HitRecord &rec,
                           Color &attenuation, Ray &r_out,
                           Random &rng) const = 0;
};

class Lambertian : public Material {
public:
  Lambertian(const Color &albedo) : albedo(albedo) {}

  bool scatter_ray(const Ray &r_in, const HitRecord &rec, Color &attenuation,
                   Ray &r_out, Random &rng) const override {
    r_out = Ray(rec.p, scatter_direction(rec.normal, random_unit_vector(rng)));
    attenuation = albedo;
    return true;
  }

  // Catch degenerate scatter direction
  static Vec3 scatter_direction(const Vec3 &normal, const Vec3 &offset) {
    Vec3 direction = normal + offset;
    if (direction.near_zero())
      return normal;
    return direction;
  }

  const Color &get_albedo() const { return albedo; }

private:
  Color albedo;
};

class Metal : public Material {
public:
  Metal(const Color &albedo, real fuzz)
      : albedo(albedo), fuzz(fuzz < 1.f ? fuzz : 1.f) {}

  // Fuzzed rays that end up below the surface are kept.
  bool scatter_ray(const Ray &r_in, const HitRecord &rec, Color &attenuation,
                   Ray &r_out, Random &rng) const override {
    Vec3 reflected = reflect(r_in.direction(), rec.normal);
    reflected = unit_vector(reflected) + (fuzz * random_unit_vector(rng));
    r_out = Ray(rec.p, reflected);
    attenuation = albedo;
    return true;
  }

  const Color &get_albedo() const { return albedo; }
  real get_fuzz() const { return fuzz; }

private:
  Color albedo;
  real fuzz;
};

class Dielectric : public Material {
public:
  Dielectric(real refraction_index) : refraction_index(refraction_index) {}

  bool scatter_ray(const Ray &r_in, const HitRecord &rec, Color &attenuation,
                   Ray &r_out, Random &rng) const override {
    attenuation = Color(1.f, 1.f, 1.f);
    real ri = rec.front_face ? (real(1) / refraction_index) : refraction_index;

    Vec3 unit_direction = unit_vector(r_in.direction());
    real cos_theta = std::fmin(dot(-unit_direction, rec.normal), real(1));
    real sin_theta = std::sqrt(real(1) - cos_theta * cos_theta);

    bool cannot_refract = ri * sin_theta > 1.f;
    Vec3 direction;

    if (cannot_refract || reflectance(cos_theta, ri) > rng.uniform())
      direction = reflect(unit_direction, rec.normal);
    else
      direction = refract(unit_direction, rec.normal, ri);

    r_out = Ray(rec.p, direction);
    return true;
  }

  real get_refraction_index() const { return refraction_index; }

  static real reflectance(real cosine, real refraction_index) {
    // Use Schlick's approximation for reflectance.
    real r0 = (1.f - refraction_index) / (1.f + refraction_index);
    r0 = r0 * r0;
    return r0 + (1.f - r0) * std::pow((1.f - cosine), 5);
  }

private:
  // Refractive index in vacuum or air, or the ratio of the material's
  // refractive index over the refractive index of the enclosing media
  real refraction_index;
};

enum MaterialType { MATERIAL_LAMBERT, MATERIAL_METAL, MATERIAL_DIELECTRIC };

} // namespace prism

#endif
