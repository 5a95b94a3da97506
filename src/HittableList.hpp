#ifndef HITTABLE_LIST_H
#define HITTABLE_LIST_H

#include "Hittable.hpp"

#include <memory>
#include <vector>

namespace prism {

class HittableList : public Hittable {
public:
  std::vector<std::shared_ptr<Hittable>> objects;

  HittableList() {}
  HittableList(std::shared_ptr<Hittable> object) { add(object); }

  void clear() { objects.clear(); }

  void add(std::shared_ptr<Hittable> object) {
    objects.push_back(std::move(object));
  }

  size_t size() const { return objects.size(); }

  bool hit(const Ray &r, Interval ray_t, HitRecord &rec) const override {
    HitRecord temp_rec;
    bool hit_anything = false;
    real closest_so_far = ray_t.max;

    for (const std::shared_ptr<Hittable> &object : objects) {
      if (object->hit(r, Interval(ray_t.min, closest_so_far), temp_rec)) {
        hit_anything = true;
        closest_so_far = temp_rec.t;
        rec = temp_rec;
      }
    }

    return hit_anything;
  }
};

} // namespace prism

#endif
