#pragma once 
#include <cstdint>
#include "macrosim/state.hpp"

namespace macrosim {
    std::uint64_t hash_state_fingerprint(const ModelState& model);
}
