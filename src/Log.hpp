#pragma once

#include "Defines.hpp"

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace prism {
class Logger {
public:
  Logger();
  ~Logger();

  static std::shared_ptr<spdlog::logger> &GetCoreLogger();
  static void SetLevel(spdlog::level::level_enum level);

  // Core log macros
#ifndef NDEBUG
#define PDEBUG(...) prism::Logger::GetCoreLogger()->debug(__VA_ARGS__)
#else
#define PDEBUG(...)
#endif
#define PTRACE(...) prism::Logger::GetCoreLogger()->trace(__VA_ARGS__)
#define PINFO(...) prism::Logger::GetCoreLogger()->info(__VA_ARGS__)
#define PWARN(...) prism::Logger::GetCoreLogger()->warn(__VA_ARGS__)
#define PERROR(...) prism::Logger::GetCoreLogger()->error(__VA_ARGS__)
#define PCRITICAL_NO_BREAK(...)                                                \
  prism::Logger::GetCoreLogger()->critical(__VA_ARGS__)
};
} // namespace prism
