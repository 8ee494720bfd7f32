#include "macrosim/stats.hpp"
#include "macrosim/util.hpp"
#include <algorithm>
#include <cmath>

namespace macrosim {

f64 mean(const Vec& values) {
  if (values.empty()) die("mean: empty input");
  f64 acc = 0.0;
  for (auto v : values) acc += v;
  return acc / (f64)values.size();
}

f64 trimmed_mean(Vec values, f64 prop) {
  if (values.empty()) die("trimmed_mean: empty input");
  if (!(prop >= 0.0 && prop < 0.5)) die("trimmed_mean: prop must be in [0,0.5) value=" + std::to_string(prop));

  const std::size_t n = values.size();
  const std::size_t cut = (std::size_t)std::floor(prop * (f64)n);

  std::sort(values.begin(), values.end());

  f64 acc = 0.0;
  for (std::size_t i = cut; i < n - cut; ++i) acc += values[i];
  return acc / (f64)(n - 2 * cut);
}

}
