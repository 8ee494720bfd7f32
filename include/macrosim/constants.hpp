#pragma once
#include "macrosim/types.hpp"

namespace macrosim {

    // employer id of a worker without a job; firm ids start at 1
    constexpr i32 UNEMPLOYED = 0;

    constexpr f64 TRIM_PROP = 0.1;
    constexpr f64 TARGET_LEVERAGE = 0.2;

}
