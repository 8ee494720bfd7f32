#pragma once

#include "macrosim/types.hpp"

namespace macrosim {

    f64 mean(const Vec& values);

    // Mean after dropping floor(prop * n) values from each tail of the sorted sample.
    // values must be non-empty and 0 <= prop < 0.5.
    f64 trimmed_mean(Vec values, f64 prop);

}
