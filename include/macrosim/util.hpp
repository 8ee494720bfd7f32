#pragma once
#include <string>

namespace macrosim {

    bool is_finite(double x);

    // Prints msg to stderr and terminates with exit status 1.
    [[noreturn]] void die(const std::string& msg);

}
