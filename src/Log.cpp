#include "Log.hpp"
#include "Assert.hpp"

namespace prism {
static std::shared_ptr<spdlog::logger> s_CoreLogger;

Logger::Logger() {
  GetCoreLogger();
  PINFO("Logger initialised");
}

Logger::~Logger() {
  PINFO("Logger destroyed");
  s_CoreLogger->flush();
}

std::shared_ptr<spdlog::logger> &Logger::GetCoreLogger() {
  if (!s_CoreLogger) {
    s_CoreLogger = spdlog::stderr_color_mt("Prism");
    s_CoreLogger->set_pattern("%^[%T] %n [%l]: %v%$");
    s_CoreLogger->set_level(spdlog::level::trace);
  }
  return s_CoreLogger;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  GetCoreLogger()->set_level(level);
}

void ReportAssertionFailure(cstring expression, cstring message, cstring file,
                            i32 line) {
  PCRITICAL_NO_BREAK(
      "Assertion Failure: {}, message: {}, in file: {}, line: {}", expression,
      message, file, line);
}
} // namespace prism
