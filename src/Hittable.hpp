#ifndef HITTABLE_H
#define HITTABLE_H

#include "Interval.hpp"
#include "Ray.hpp"

#include <memory>

namespace prism {

class Material;

struct HitRecord {
  Point3 p;
  Vec3 normal;
  std::shared_ptr<Material> mat;
  real t = 0.f;
  bool front_face = false;

  // Sets the hit record normal vector.
  // NOTE: the parameter `outward_normal` is assumed to have unit length.
  void set_face_normal(const Ray &r, const Vec3 &outward_normal) {
    front_face = dot(r.direction(), outward_normal) < 0.f;
    normal = front_face ? outward_normal : -outward_normal;
  }
};

class Hittable {
public:
  virtual ~Hittable() = default;

  virtual bool hit(const Ray &r, Interval ray_t, HitRecord &rec) const = 0;
};

} // namespace prism

#endif
