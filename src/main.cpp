#include "Camera.hpp"
#include "Image.hpp"
#include "Log.hpp"
#include "Random.hpp"
#include "Scene.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  using namespace prism;
  Logger logger;

  i32 arg_idx = 1;
  std::filesystem::path scene_path;
  std::filesystem::path image_path;
  Random &rng = Random::global();
  if (argc > 1) {
    // Check if the first argument is the scene
    if (argv[arg_idx][0] != '-') {
      std::filesystem::path input_path = argv[1];
      scene_path = std::filesystem::absolute(input_path);
      ++arg_idx;
    }
    // Check for other arguments
    for (; arg_idx < argc; ++arg_idx) {
      cstring arg = argv[arg_idx];
      if (arg[0] != '-') {
        PWARN("Ignoring argument: {}", arg);
        continue;
      }
      if (!strcmp(arg + 1, "o")) {
        ++arg_idx;
        if (arg_idx >= argc) {
          PWARN("No output image file passed!");
        } else {
          std::filesystem::path output_path = argv[arg_idx];
          image_path = std::filesystem::absolute(output_path);
        }
      } else if (!strcmp(arg + 1, "seed")) {
        ++arg_idx;
        if (arg_idx >= argc) {
          PWARN("No seed value passed!");
        } else {
          char *end = nullptr;
          u64 seed = std::strtoull(argv[arg_idx], &end, 10);
          if (end == argv[arg_idx] || *end != '\0') {
            PWARN("Invalid seed: {}", argv[arg_idx]);
          } else {
            rng.seed(seed);
            PINFO("Using seed {}", seed);
          }
        }
      } else {
        PWARN("Unknown option: {}", arg);
      }
    }
  }

  Scene scene;
  if (scene_path.empty() || !load_scene(scene_path, scene)) {
    load_default_scene(scene, rng);
  }

  if (!image_path.empty() && image_path.extension() != ".png" &&
      image_path.extension() != ".ppm") {
    std::string old_ext = image_path.extension().string();
    PWARN("Image extension type: [{}] not supported.", old_ext);
    image_path = std::filesystem::current_path() / "image.ppm";
  }

  Camera camera(scene.camera);
  PINFO("Rendering {}x{} with {} samples per pixel, max depth {}",
        camera.get_image_width(), camera.get_image_height(),
        scene.camera.samples_per_pixel, scene.camera.max_depth);

  Image image(image_path.empty() ? 0 : camera.get_image_width(),
              image_path.empty() ? 0 : camera.get_image_height());
  auto start = std::chrono::steady_clock::now();
  if (image_path.empty()) {
    camera.render(scene.world, rng, std::cout);
  } else {
    camera.render(scene.world, rng, image.pixels());
  }
  auto end = std::chrono::steady_clock::now();

  f64 seconds = std::chrono::duration<f64>(end - start).count();
  PINFO("Total time: {} seconds", seconds);

  if (image_path.empty()) {
    std::cout.flush();
    if (!std::cout) {
      PERROR("Failed to write image to stdout");
      return 1;
    }
    return 0;
  }

  bool written = image_path.extension() == ".png"
                     ? write_png(image_path, image)
                     : write_ppm(image_path, image);
  if (!written) {
    return 1;
  }
  PTRACE("Image saved to: {}", image_path.string());
  return 0;
}
