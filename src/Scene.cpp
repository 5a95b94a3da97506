#include "Scene.hpp"
#include "Interval.hpp"
#include "Log.hpp"
#include "Material.hpp"
#include "Sphere.hpp"

#include <simdjson.h>
#include <string_view>
#include <vector>

namespace prism {

namespace {

using simdjson::ondemand::array;
using simdjson::ondemand::object;

void read_real(object &obj, std::string_view key, real &out) {
  double value = 0.0;
  simdjson::error_code error = obj[key].get_double().get(value);
  if (error == simdjson::NO_SUCH_FIELD)
    return;
  if (error)
    throw simdjson::simdjson_error(error);
  out = real(value);
}

void read_u32(object &obj, std::string_view key, u32 &out) {
  uint64_t value = 0;
  simdjson::error_code error = obj[key].get_uint64().get(value);
  if (error == simdjson::NO_SUCH_FIELD)
    return;
  if (error)
    throw simdjson::simdjson_error(error);
  if (value > u32_max)
    throw simdjson::simdjson_error(simdjson::NUMBER_OUT_OF_RANGE);
  out = u32(value);
}

bool read_vec3(object &obj, std::string_view key, Vec3 &out) {
  array values;
  simdjson::error_code error = obj[key].get_array().get(values);
  if (error == simdjson::NO_SUCH_FIELD)
    return false;
  if (error)
    throw simdjson::simdjson_error(error);

  Vec3 result;
  i32 index = 0;
  for (auto value : values) {
    if (index >= 3)
      throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
    result.e[index++] = real(value.get_double().value());
  }
  if (index != 3)
    throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);

  out = result;
  return true;
}

Vec3 require_vec3(object &obj, std::string_view key) {
  Vec3 result;
  if (!read_vec3(obj, key, result))
    throw simdjson::simdjson_error(simdjson::NO_SUCH_FIELD);
  return result;
}

void read_camera(object &camera, CameraConfig &config) {
  read_vec3(camera, "lookfrom", config.lookfrom);
  read_vec3(camera, "lookat", config.lookat);
  read_vec3(camera, "vup", config.vup);
  read_real(camera, "defocus_angle", config.defocus_angle);
  read_real(camera, "focus_dist", config.focus_dist);
  read_u32(camera, "image_width", config.image_width);
  read_real(camera, "aspect_ratio", config.aspect_ratio);
  read_u32(camera, "samples_per_pixel", config.samples_per_pixel);
  read_u32(camera, "max_depth", config.max_depth);
  read_real(camera, "vfov", config.vfov);
}

bool parse_scene(simdjson::ondemand::document &doc, Scene &scene) {
  // Load camera settings
  object camera;
  simdjson::error_code error = doc["camera"].get_object().get(camera);
  if (error && error != simdjson::NO_SUCH_FIELD)
    throw simdjson::simdjson_error(error);
  if (!error)
    read_camera(camera, scene.camera);

  if (scene.camera.image_width == 0 || scene.camera.samples_per_pixel == 0 ||
      scene.camera.aspect_ratio <= 0.f) {
    PERROR("Camera needs a positive image_width, samples_per_pixel and "
           "aspect_ratio");
    return false;
  }
  real image_height = scene.camera.image_width / scene.camera.aspect_ratio;
  if (!Interval(0.f, real(u32_max)).contains(image_height)) {
    PERROR("aspect_ratio {} gives an image height out of range",
           scene.camera.aspect_ratio);
    return false;
  }

  // Load Materials
  std::vector<std::shared_ptr<Material>> materials;
  array material_array = doc["materials"].get_array();
  for (auto element : material_array) {
    object mat = element.get_object();
    int64_t type_id = mat["type_id"].get_int64().value();

    switch (type_id) {
    case MATERIAL_LAMBERT: {
      materials.push_back(
          std::make_shared<Lambertian>(require_vec3(mat, "albedo")));
      break;
    }
    case MATERIAL_METAL: {
      Color albedo = require_vec3(mat, "albedo");
      real fuzz = 0.f;
      read_real(mat, "fuzz", fuzz);
      materials.push_back(std::make_shared<Metal>(albedo, fuzz));
      break;
    }
    case MATERIAL_DIELECTRIC: {
      real ior = real(mat["ior"].get_double().value());
      materials.push_back(std::make_shared<Dielectric>(ior));
      break;
    }
    default:
      PERROR("Unknown material type_id: {}", type_id);
      return false;
    }
  }

  // Load Spheres
  array sphere_array = doc["spheres"].get_array();
  for (auto element : sphere_array) {
    object sphere = element.get_object();
    int64_t mat_index = sphere["material_index"].get_int64().value();
    real radius = real(sphere["radius"].get_double().value());
    Point3 center = require_vec3(sphere, "center");

    if (mat_index < 0 || size_t(mat_index) >= materials.size()) {
      PERROR("Sphere material_index {} out of range ({} materials)",
             mat_index, materials.size());
      return false;
    }

    scene.world.add(
        std::make_shared<Sphere>(center, radius, materials[mat_index]));
  }

  PINFO("Loaded {} materials and {} spheres", materials.size(),
        scene.world.size());
  return true;
}

} // namespace

void load_default_scene(Scene &scene, Random &rng) {
  scene.world.clear();

  auto mat_ground = std::make_shared<Lambertian>(Color(0.5f, 0.5f, 0.5f));
  scene.world.add(
      std::make_shared<Sphere>(Point3(0.f, -1000.f, -1.f), 1000.f, mat_ground));

  i32 size = 11;
  for (i32 a = -size; a < size; ++a) {
    for (i32 b = -size; b < size; ++b) {
      Point3 center(a + 0.9f * rng.uniform(), 0.2f, b + 0.9f * rng.uniform());

      if ((center - Point3(4.f, 0.2f, 0.f)).length() > 0.9f) {
        real choose_mat = rng.uniform();
        std::shared_ptr<Material> sphere_material;

        if (choose_mat < 0.8f) {
          // diffuse
          Color albedo = Color::random(rng) * Color::random(rng);
          sphere_material = std::make_shared<Lambertian>(albedo);
        } else if (choose_mat < 0.95f) {
          // metal
          Color albedo = Color::random(rng, 0.5f, 1.f);
          real fuzz = rng.uniform(0.f, 0.5f);
          sphere_material = std::make_shared<Metal>(albedo, fuzz);
        } else {
          // glass
          sphere_material = std::make_shared<Dielectric>(1.5f);
        }
        scene.world.add(std::make_shared<Sphere>(center, 0.2f, sphere_material));
      }
    }
  }

  auto mat1 = std::make_shared<Dielectric>(1.5f);
  scene.world.add(std::make_shared<Sphere>(Point3(0.f, 1.f, 0.f), 1.f, mat1));
  auto mat2 = std::make_shared<Lambertian>(Color(0.4f, 0.2f, 0.1f));
  scene.world.add(std::make_shared<Sphere>(Point3(-4.f, 1.f, 0.f), 1.f, mat2));
  auto mat3 = std::make_shared<Metal>(Color(0.7f, 0.6f, 0.5f), 0.f);
  scene.world.add(std::make_shared<Sphere>(Point3(4.f, 1.f, 0.f), 1.f, mat3));

  // Initialize
  CameraConfig &camera = scene.camera;
  camera.aspect_ratio = 16.f / 9.f;
  camera.image_width = 600;
  camera.samples_per_pixel = 100;
  camera.max_depth = 25;
  camera.vfov = 20.f;
  camera.lookfrom = Point3(13.f, 2.f, 3.f);
  camera.lookat = Point3(0.f, 0.f, 0.f);
  camera.vup = Vec3(0.f, 1.f, 0.f);
  camera.defocus_angle = 0.6f;
  camera.focus_dist = 10.f;

  PINFO("Built default scene with {} spheres", scene.world.size());
}

bool load_scene(const std::filesystem::path &scene_path, Scene &scene) {
  if (!std::filesystem::exists(scene_path)) {
    PERROR("Error: JSON file not found at path: {}", scene_path.string());
    return false;
  }

  Scene loaded;
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json =
        simdjson::padded_string::load(scene_path.string());
    simdjson::ondemand::document doc = parser.iterate(json);
    if (!parse_scene(doc, loaded))
      return false;
  } catch (const simdjson::simdjson_error &e) {
    PERROR("Failed to parse scene {}: {}", scene_path.string(), e.what());
    return false;
  }

  scene = std::move(loaded);
  return true;
}

} // namespace prism
