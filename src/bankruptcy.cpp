#include "macrosim/bankruptcy.hpp"
#include "macrosim/stats.hpp"
#include "macrosim/constants.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

namespace macrosim {

void write_off_firm_debt(Bank& bank, f64 liquidity, f64 debt) {
  const f64 residual = liquidity - debt;
  bank.profitsB += residual;
  bank.loans -= debt;
  bank.E += residual;
}

i32 release_workforce(i32 firm_id, std::vector<Worker>& workers) {
  i32 released = 0;
  for (auto& wk : workers) {
    if (wk.Oc != firm_id) continue;
    wk.Oc = UNEMPLOYED;
    wk.w = 0.0;
    released += 1;
  }
  return released;
}

void firm_fires_all_workers(ConsumptionFirm& firm, std::vector<Worker>& workers) {
  release_workforce(firm.firm_id, workers);
  firm.Leff = 0.0;
}

void firm_fires_all_workers(CapitalFirm& firm, std::vector<Worker>& workers) {
  release_workforce(firm.firm_id, workers);
  firm.Leff_k = 0.0;
}

namespace {

struct ConsumptionKind {
  using Firm = ConsumptionFirm;

  static std::vector<Firm>& population(ModelState& m) { return m.consumption_firms; }
  static i32& default_counter(Aggregates& agg) { return agg.defaults; }
  static const char* all_insolvent_warning() { return "WARNING: all consumption firms are very indebted"; }

  static f64 net_worth(const Firm& f) { return f.A; }
  static f64 liquidity(const Firm& f) { return f.liquidity; }
  static f64 debt(const Firm& f) { return f.deb; }
  static f64 price(const Firm& f) { return f.P; }
  static f64 prior_output(const Firm& f) { return f.Y_prev; }
  static bool is_solvent(const Firm& f) { return (f.liquidity - f.deb) > 0.0; }

  // the entrant keeps its machines, valued at the current capital price
  static void reset_balance_sheet(Firm& f, const ModelState& m, f64 price) {
    f.A = f.PA + f.K * m.agg.price_k;
    f.capital_value = f.K * m.agg.price_k;
    f.PA = 0.0;
    f.liquidity = f.A - f.K * m.agg.price_k;
    f.deb = 0.0;
    f.P = price;
  }

  static void reset_plan(Firm& f, const ModelState& m, f64 y_prev) {
    f.Y_prev = y_prev;
    f.Yd = f.Y_prev;
    // an entrant without machines has no capital-output ratio to speak of
    f.x = f.K > 0.0 ? f.Y_prev / m.params.k / f.K : 0.0;
    f.barK = f.K;
    f.barYK = f.Y_prev / m.params.k;
    f.Y = 0.0;
    f.stock = 0.0;
    f.interest_r = m.params.r_f;
  }
};

struct CapitalKind {
  using Firm = CapitalFirm;

  static std::vector<Firm>& population(ModelState& m) { return m.capital_firms; }
  static i32& default_counter(Aggregates& agg) { return agg.defaults_k; }
  static const char* all_insolvent_warning() { return "WARNING: all capital firms are bankrupted"; }

  static f64 net_worth(const Firm& f) { return f.A_k; }
  static f64 liquidity(const Firm& f) { return f.liquidity_k; }
  static f64 debt(const Firm& f) { return f.deb_k; }
  static f64 price(const Firm& f) { return f.P_k; }
  static f64 prior_output(const Firm& f) { return f.Y_prev_k; }
  static bool is_solvent(const Firm& f) { return f.A_k > 0.0; }

  static void reset_balance_sheet(Firm& f, const ModelState&, f64 price) {
    f.A_k = f.PA;
    f.PA = 0.0;
    f.liquidity_k = f.A_k;
    f.deb_k = 0.0;
    f.P_k = price;
  }

  static void reset_plan(Firm& f, const ModelState& m, f64 y_prev) {
    f.Y_prev_k = y_prev;
    f.Y_kd = f.Y_prev_k;
    f.Y_k = 0.0;
    f.stock_k = 0.0;
    f.interest_r_k = m.params.r_f;
  }
};

// Largest output an entrant with net worth A can finance at the target leverage.
f64 leverage_bounded_output(f64 A, const ModelState& m) {
  const f64 funds = A + TARGET_LEVERAGE * A / (1.0 - TARGET_LEVERAGE);
  return funds / m.agg.wb * m.params.alpha;
}

template <typename Kind>
void reinitialize_bankrupt_firm(typename Kind::Firm& firm, ModelState& model) {
  const auto& firms = Kind::population(model);

  Kind::default_counter(model.agg) += 1;

  write_off_firm_debt(model.bank, Kind::liquidity(firm), Kind::debt(firm));

  Vec prices;
  prices.reserve(firms.size());
  for (const auto& f : firms) prices.push_back(Kind::price(f));
  const f64 mean_price = mean(prices);

  Vec to_trim;
  for (const auto& f : firms) {
    if (Kind::is_solvent(f)) to_trim.push_back(Kind::prior_output(f));
  }

  f64 tmean_y_prev = 0.0;
  if (to_trim.empty()) {
    std::cout << Kind::all_insolvent_warning() << std::endl;
    tmean_y_prev = std::numeric_limits<f64>::infinity();
  } else {
    tmean_y_prev = trimmed_mean(std::move(to_trim), TRIM_PROP);
  }

  Kind::reset_balance_sheet(firm, model, mean_price);

  const f64 mx_y = leverage_bounded_output(Kind::net_worth(firm), model);
  Kind::reset_plan(firm, model, std::min(tmean_y_prev, mx_y));

  firm_fires_all_workers(firm, model.workers);
}

template <typename Kind>
void sweep_population(ModelState& model) {
  auto& firms = Kind::population(model);
  for (std::size_t i = 0; i < firms.size(); ++i) {
    if (Kind::net_worth(firms[i]) < 0.0) reinitialize_bankrupt_firm<Kind>(firms[i], model);
  }
}

}

void firm_goes_bankrupt(ConsumptionFirm& firm, ModelState& model) {
  reinitialize_bankrupt_firm<ConsumptionKind>(firm, model);
}

void firm_goes_bankrupt(CapitalFirm& firm, ModelState& model) {
  reinitialize_bankrupt_firm<CapitalKind>(firm, model);
}

void firms_go_bankrupt(ModelState& model) {
  sweep_population<ConsumptionKind>(model);
  sweep_population<CapitalKind>(model);
}

}
