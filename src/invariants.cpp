#include "macrosim/invariants.hpp"
#include "macrosim/constants.hpp"
#include "macrosim/util.hpp"
#include <string>

namespace macrosim {

static std::string where(int step) {
  return "invariant fail step=" + std::to_string(step) + " ";
}

static std::string firm_label(const char* kind, i32 firm_id) {
  return std::string(kind) + " firm " + std::to_string(firm_id);
}

static void require_finite(double x, const std::string& owner, const char* field, int step) {
  if (!is_finite(x)) die(where(step) + owner + " non-finite " + field);
}

static void require_nonneg(double x, const std::string& owner, const char* field, int step) {
  if (!(x >= 0.0)) die(where(step) + owner + " negative " + field + " value=" + std::to_string(x));
}

void check_invariants(const ModelState& model, int step) {
  require_finite(model.bank.profitsB, "bank", "profitsB", step);
  require_finite(model.bank.loans, "bank", "loans", step);
  require_finite(model.bank.E, "bank", "E", step);

  if (model.agg.defaults < 0 || model.agg.defaults_k < 0) die(where(step) + "negative default counter");

  for (const auto& f : model.consumption_firms) {
    const auto owner = firm_label("consumption", f.firm_id);
    require_finite(f.A, owner, "A", step);
    require_finite(f.liquidity, owner, "liquidity", step);
    require_finite(f.deb, owner, "deb", step);
    require_finite(f.P, owner, "P", step);
    require_finite(f.Y_prev, owner, "Y_prev", step);
    require_finite(f.Yd, owner, "Yd", step);
    require_finite(f.x, owner, "x", step);

    require_nonneg(f.A, owner, "A", step);
    require_nonneg(f.deb, owner, "deb", step);
    require_nonneg(f.Y_prev, owner, "Y_prev", step);
  }

  for (const auto& f : model.capital_firms) {
    const auto owner = firm_label("capital", f.firm_id);
    require_finite(f.A_k, owner, "A_k", step);
    require_finite(f.liquidity_k, owner, "liquidity_k", step);
    require_finite(f.deb_k, owner, "deb_k", step);
    require_finite(f.P_k, owner, "P_k", step);
    require_finite(f.Y_prev_k, owner, "Y_prev_k", step);
    require_finite(f.Y_kd, owner, "Y_kd", step);

    require_nonneg(f.A_k, owner, "A_k", step);
    require_nonneg(f.deb_k, owner, "deb_k", step);
    require_nonneg(f.Y_prev_k, owner, "Y_prev_k", step);
  }

  for (const auto& wk : model.workers) {
    const auto owner = "worker " + std::to_string(wk.worker_id);
    require_nonneg(wk.w, owner, "w", step);
    if (wk.Oc == UNEMPLOYED && wk.w != 0.0)
      die(where(step) + "unemployed " + owner + " has wage=" + std::to_string(wk.w));
  }
}

}
