#pragma once

#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdint.h>

#if !defined(_MSC_VER)
#include <signal.h>
#endif

// Macros ////////////////////////////////////////////////////////////////

#if defined(_MSC_VER)
#define PRISM_DEBUG_BREAK __debugbreak();
#else
#define PRISM_DEBUG_BREAK raise(SIGTRAP);
#endif // MSVC

// Native types typedefs /////////////////////////////////////////////////
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

typedef float f32;
typedef double f64;

typedef const char *cstring;

static const u32 u32_max = UINT32_MAX;

#ifdef USE_DOUBLE_PRECISION
typedef double real;
#else
typedef float real;
#endif

namespace prism {

// Constants
const real infinity = std::numeric_limits<real>::infinity();
const real pi = real(3.1415926535897932385);

// Utility Functions
inline real degrees_to_radians(real degrees) { return degrees * pi / 180.f; }

inline real linear_to_gamma(real linear_component) {
  if (linear_component > 0.f)
    return std::sqrt(linear_component);
  return 0.f;
}

} // namespace prism
