#include "macrosim/fingerprint.hpp"
#include <cstdint>
#include <cstring>

namespace macrosim {

static constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
static constexpr std::uint64_t kFnvPrime = 1099511628211ull;

// Folds the object representation of v into the running FNV-1a state h.
template <typename T>
static void mix(std::uint64_t& h, const T& v) {
  unsigned char bytes[sizeof(T)];
  std::memcpy(bytes, &v, sizeof(T));
  for (unsigned char b : bytes) {
    h ^= b;
    h *= kFnvPrime;
  }
}

std::uint64_t hash_state_fingerprint(const ModelState& model) {
  std::uint64_t h = kFnvOffset;

  mix(h, model.bank.profitsB);
  mix(h, model.bank.loans);
  mix(h, model.bank.E);
  mix(h, model.agg.defaults);
  mix(h, model.agg.defaults_k);

  for (const auto& f : model.consumption_firms) {
    mix(h, f.firm_id);
    mix(h, f.A);
    mix(h, f.liquidity);
    mix(h, f.deb);
    mix(h, f.P);
    mix(h, f.Y_prev);
    mix(h, f.Yd);
    mix(h, f.Leff);
  }

  for (const auto& f : model.capital_firms) {
    mix(h, f.firm_id);
    mix(h, f.A_k);
    mix(h, f.liquidity_k);
    mix(h, f.deb_k);
    mix(h, f.P_k);
    mix(h, f.Y_prev_k);
    mix(h, f.Y_kd);
    mix(h, f.Leff_k);
  }

  for (const auto& wk : model.workers) {
    mix(h, wk.Oc);
    mix(h, wk.w);
  }

  return h;
}

}
