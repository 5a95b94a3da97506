#pragma once

#include "Camera.hpp"
#include "HittableList.hpp"
#include "Random.hpp"

#include <filesystem>

namespace prism {

struct Scene {
  HittableList world;
  CameraConfig camera;
};

// Ground plane, a grid of small random spheres and three large feature
// spheres, viewed through a depth-of-field camera.
void load_default_scene(Scene &scene, Random &rng);

// Reads camera settings, materials and spheres from a JSON file. Leaves the
// scene untouched and returns false if the file is missing or malformed.
bool load_scene(const std::filesystem::path &scene_path, Scene &scene);

} // namespace prism
