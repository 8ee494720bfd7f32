#include "macrosim/util.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace macrosim {

bool is_finite(double x) {
  return std::isfinite(x);
}

void die(const std::string& msg) {
  std::cerr << msg << std::endl;
  std::exit(1);
}

}
