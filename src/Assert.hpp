#pragma once

#include "Defines.hpp"

namespace prism {
void ReportAssertionFailure(cstring expression, cstring message, cstring file,
                            i32 line);
} // namespace prism

#ifndef NDEBUG
#define PASSERT(expr)                                                          \
  if (expr) {                                                                  \
  } else {                                                                     \
    prism::ReportAssertionFailure(#expr, "", __FILE__, __LINE__);              \
    PRISM_DEBUG_BREAK                                                          \
  }

#define PASSERT_MSG(expr, message)                                             \
  if (expr) {                                                                  \
  } else {                                                                     \
    prism::ReportAssertionFailure(#expr, message, __FILE__, __LINE__);         \
    PRISM_DEBUG_BREAK                                                          \
  }
#else
#define PASSERT(expr)
#define PASSERT_MSG(expr, message)
#endif
