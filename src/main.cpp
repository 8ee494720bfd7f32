#include <iostream>
#include <chrono>
#include <string>
#include "macrosim/config.hpp"
#include "macrosim/bankruptcy.hpp"
#include "macrosim/invariants.hpp"
#include "macrosim/fingerprint.hpp"

int main(int argc, char** argv) {
  const std::string path = argc > 1 ? argv[1] : "config/base.json";
  auto cfg = macrosim::load_config(path);
  macrosim::validate_config(cfg);

  auto model = macrosim::init_model(cfg);

  const auto t0 = std::chrono::steady_clock::now();
  macrosim::firms_go_bankrupt(model);
  const auto t1 = std::chrono::steady_clock::now();

  macrosim::check_invariants(model, 0);

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
  std::cout << "sweep_ok defaults=" << model.agg.defaults << " defaults_k=" << model.agg.defaults_k
            << " bank_E=" << model.bank.E << " loans=" << model.bank.loans
            << " unemployed=" << macrosim::count_unemployed(model)
            << " ms=" << ms << " hash=" << macrosim::hash_state_fingerprint(model) << "\n";
  return 0;
}
