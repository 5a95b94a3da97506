#ifndef SPHERE_H
#define SPHERE_H

#include "Hittable.hpp"
#include "Vec3.hpp"

namespace prism {

class Sphere : public Hittable {
public:
  Sphere(const Point3 &center, real radius, std::shared_ptr<Material> mat)
      : center(center), radius(std::fmax(real(0), radius)),
        mat(std::move(mat)) {}

  bool hit(const Ray &r, Interval ray_t, HitRecord &rec) const override {
    Vec3 oc = center - r.origin();
    real a = r.direction().length_squared();
    real h = dot(r.direction(), oc);
    real c = oc.length_squared() - radius * radius;

    real discriminant = h * h - a * c;
    if (discriminant < 0.f)
      return false;

    real sqrtd = std::sqrt(discriminant);

    // Find the nearest root that lies in the acceptable range.
    real root = (h - sqrtd) / a;
    if (!ray_t.surrounds(root)) {
      root = (h + sqrtd) / a;
      if (!ray_t.surrounds(root))
        return false;
    }

    rec.t = root;
    rec.p = r.at(rec.t);
    Vec3 outward_normal = (rec.p - center) / radius;
    rec.set_face_normal(r, outward_normal);
    rec.mat = mat;

    return true;
  }

  const Point3 &get_center() const { return center; }
  real get_radius() const { return radius; }
  const std::shared_ptr<Material> &get_material() const { return mat; }

private:
  Point3 center;
  real radius;
  std::shared_ptr<Material> mat;
};

} // namespace prism

#endif
