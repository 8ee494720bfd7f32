#pragma once
#include <cstdint>
#include <vector>

namespace macrosim {

using i32 = std::int32_t;
using u64 = std::uint64_t;
using f64 = double;

using Vec = std::vector<f64>;

}
