#include "Material.hpp"

#include <gtest/gtest.h>

using namespace prism;

namespace {

const real kEpsilon = 1e-5f;

HitRecord make_record(const Ray &ray, const Vec3 &outward_normal) {
  HitRecord rec;
  rec.p = Point3(0.f, 0.f, 0.f);
  rec.t = 1.f;
  rec.set_face_normal(ray, outward_normal);
  return rec;
}

void expect_vec_near(const Vec3 &actual, const Vec3 &expected) {
  EXPECT_NEAR(actual.x(), expected.x(), kEpsilon);
  EXPECT_NEAR(actual.y(), expected.y(), kEpsilon);
  EXPECT_NEAR(actual.z(), expected.z(), kEpsilon);
}

} // namespace

TEST(VectorMathTest, NearZeroUsesPerAxisEpsilon) {
  EXPECT_TRUE(Vec3(1e-9f, -1e-9f, 0.f).near_zero());
  EXPECT_FALSE(Vec3(1e-9f, 1e-7f, 0.f).near_zero());
}

TEST(VectorMathTest, Reflect) {
  expect_vec_near(reflect(Vec3(1.f, -1.f, 0.f), Vec3(0.f, 1.f, 0.f)),
                  Vec3(1.f, 1.f, 0.f));
}

TEST(VectorMathTest, RefractHeadOnKeepsDirection) {
  expect_vec_near(refract(Vec3(0.f, -1.f, 0.f), Vec3(0.f, 1.f, 0.f), 1.f / 1.5f),
                  Vec3(0.f, -1.f, 0.f));
}

TEST(VectorMathTest, RefractFollowsSnell) {
  // 45 degrees in, index ratio 1/1.5.
  real ratio = real(1) / real(1.5);
  Vec3 incoming = unit_vector(Vec3(1.f, -1.f, 0.f));
  Vec3 refracted = refract(incoming, Vec3(0.f, 1.f, 0.f), ratio);
  real sin_in = incoming.x();
  real sin_out = refracted.x() / refracted.length();
  EXPECT_NEAR(refracted.length(), 1.f, kEpsilon);
  EXPECT_NEAR(sin_out, ratio * sin_in, kEpsilon);
  EXPECT_LT(refracted.y(), 0.f);
}

TEST(VectorMathTest, RandomUnitVectorHasUnitLength) {
  Random rng(7);
  for (i32 i = 0; i < 100; ++i) {
    EXPECT_NEAR(random_unit_vector(rng).length(), 1.f, kEpsilon);
  }
}

TEST(VectorMathTest, RandomInUnitDiskStaysInDisk) {
  Random rng(11);
  for (i32 i = 0; i < 100; ++i) {
    Vec3 p = random_in_unit_disk(rng);
    EXPECT_LT(p.length_squared(), 1.f);
    EXPECT_EQ(p.z(), real(0));
  }
}

TEST(LambertianTest, AlwaysScattersWithAlbedo) {
  Random rng(1);
  Color albedo(0.2f, 0.4f, 0.6f);
  Lambertian lambertian(albedo);
  Ray ray(Point3(0.f, 1.f, 0.f), Vec3(0.f, -1.f, 0.f));
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));

  for (i32 i = 0; i < 100; ++i) {
    Color attenuation;
    Ray scattered;
    ASSERT_TRUE(lambertian.scatter_ray(ray, rec, attenuation, scattered, rng));
    expect_vec_near(attenuation, albedo);
    expect_vec_near(scattered.origin(), rec.p);
    EXPECT_FALSE(scattered.direction().near_zero());
    // normal + unit vector never points below the surface.
    EXPECT_GE(dot(scattered.direction(), rec.normal), -kEpsilon);
  }
}

TEST(LambertianTest, DegenerateDirectionFallsBackToNormal) {
  Vec3 normal(0.f, 1.f, 0.f);
  expect_vec_near(Lambertian::scatter_direction(normal, -normal), normal);

  Vec3 nearly_opposite(1e-9f, -1.f, 0.f);
  expect_vec_near(Lambertian::scatter_direction(normal, nearly_opposite),
                  normal);

  Vec3 offset(0.f, 0.f, 1.f);
  expect_vec_near(Lambertian::scatter_direction(normal, offset),
                  Vec3(0.f, 1.f, 1.f));
}

TEST(MetalTest, FuzzIsClampedToOne) {
  Metal metal(Color(1.f, 1.f, 1.f), 3.f);
  EXPECT_EQ(metal.get_fuzz(), real(1));
  Metal smooth(Color(1.f, 1.f, 1.f), 0.3f);
  EXPECT_EQ(smooth.get_fuzz(), real(0.3f));
}

TEST(MetalTest, ZeroFuzzIsMirrorReflection) {
  Random rng(3);
  Color albedo(0.7f, 0.6f, 0.5f);
  Metal metal(albedo, 0.f);
  Ray ray(Point3(-1.f, 1.f, 0.f), Vec3(2.f, -2.f, 0.f));
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));

  Color attenuation;
  Ray scattered;
  ASSERT_TRUE(metal.scatter_ray(ray, rec, attenuation, scattered, rng));
  expect_vec_near(attenuation, albedo);
  expect_vec_near(scattered.direction(), unit_vector(Vec3(1.f, 1.f, 0.f)));
}

TEST(MetalTest, FuzzedRayStaysWithinFuzzOfReflection) {
  Random rng(5);
  real fuzz = 0.5f;
  Metal metal(Color(1.f, 1.f, 1.f), fuzz);
  Ray ray(Point3(-1.f, 1.f, 0.f), Vec3(1.f, -1.f, 0.f));
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));
  Vec3 mirror = unit_vector(Vec3(1.f, 1.f, 0.f));

  for (i32 i = 0; i < 100; ++i) {
    Color attenuation;
    Ray scattered;
    ASSERT_TRUE(metal.scatter_ray(ray, rec, attenuation, scattered, rng));
    EXPECT_NEAR((scattered.direction() - mirror).length(), fuzz, kEpsilon);
  }
}

TEST(MetalTest, GrazingFuzzedRayStillScatters) {
  // A fully fuzzed grazing reflection can dip below the surface; it is kept.
  Random rng(9);
  Metal metal(Color(1.f, 1.f, 1.f), 1.f);
  Ray ray(Point3(-1.f, 0.01f, 0.f), Vec3(1.f, -0.01f, 0.f));
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));

  bool saw_below_surface = false;
  for (i32 i = 0; i < 200; ++i) {
    Color attenuation;
    Ray scattered;
    ASSERT_TRUE(metal.scatter_ray(ray, rec, attenuation, scattered, rng));
    if (dot(scattered.direction(), rec.normal) < 0.f)
      saw_below_surface = true;
  }
  EXPECT_TRUE(saw_below_surface);
}

TEST(DielectricTest, ReflectanceHeadOnEqualsBaseTerm) {
  real ri = 1.5f;
  real r0 = (1.f - ri) / (1.f + ri);
  r0 = r0 * r0;
  EXPECT_NEAR(Dielectric::reflectance(1.f, ri), r0, 1e-7f);
  EXPECT_NEAR(Dielectric::reflectance(1.f, 1.f / ri), r0, 1e-7f);
  EXPECT_NEAR(r0, 0.04f, 1e-6f);
}

TEST(DielectricTest, ReflectanceAtGrazingAngleIsOne) {
  EXPECT_NEAR(Dielectric::reflectance(0.f, 1.5f), 1.f, 1e-6f);
}

TEST(DielectricTest, TotalInternalReflection) {
  Random rng(13);
  Dielectric glass(1.5f);
  // Exiting the glass at a grazing angle: ri * sin_theta > 1.
  Vec3 incoming = unit_vector(Vec3(1.f, 0.2f, 0.f));
  Ray ray(Point3(0.f, -1.f, 0.f), incoming);
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));
  ASSERT_FALSE(rec.front_face);

  for (i32 i = 0; i < 50; ++i) {
    Color attenuation;
    Ray scattered;
    ASSERT_TRUE(glass.scatter_ray(ray, rec, attenuation, scattered, rng));
    expect_vec_near(attenuation, Color(1.f, 1.f, 1.f));
    expect_vec_near(scattered.direction(), reflect(incoming, rec.normal));
  }
}

TEST(DielectricTest, HeadOnRayMostlyRefracts) {
  Random rng(17);
  Dielectric glass(1.5f);
  Ray ray(Point3(0.f, 1.f, 0.f), Vec3(0.f, -1.f, 0.f));
  HitRecord rec = make_record(ray, Vec3(0.f, 1.f, 0.f));
  ASSERT_TRUE(rec.front_face);

  i32 refracted = 0;
  const i32 trials = 2000;
  for (i32 i = 0; i < trials; ++i) {
    Color attenuation;
    Ray scattered;
    ASSERT_TRUE(glass.scatter_ray(ray, rec, attenuation, scattered, rng));
    expect_vec_near(attenuation, Color(1.f, 1.f, 1.f));
    if (scattered.direction().y() < 0.f)
      ++refracted;
  }
  // Schlick gives a 4% reflection chance head-on.
  real fraction = real(refracted) / trials;
  EXPECT_GT(fraction, 0.92f);
  EXPECT_LT(fraction, 0.99f);
}
