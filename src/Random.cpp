#include "Random.hpp"

namespace prism {

Random &Random::global() {
  static Random generator;
  return generator;
}

} // namespace prism
