#pragma once
#include <string>
#include <vector>
#include "macrosim/types.hpp"
#include "macrosim/state.hpp"

namespace macrosim {

    // A scenario: model parameters plus the agent populations at the start of the
    // bankruptcy phase.
    struct ModelConfig{

        Params params;
        Aggregates agg;
        Bank bank;

        std::vector<ConsumptionFirm> consumption_firms;
        std::vector<CapitalFirm> capital_firms;
        std::vector<Worker> workers;
    };

    ModelConfig load_config(const std::string& path);
    ModelConfig parse_config(const std::string& text);
    void validate_config(const ModelConfig& cfg);

    ModelState init_model(const ModelConfig& cfg);
}
