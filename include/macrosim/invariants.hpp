#pragma once
#include "macrosim/state.hpp"

namespace macrosim {

    // Post-sweep consistency checks; calls die() on the first violation.
    void check_invariants(const ModelState& model, int step);

}
