#pragma once
#include "macrosim/types.hpp"
#include <vector>

namespace macrosim {

struct ConsumptionFirm {
  i32 firm_id;
  f64 A;
  f64 liquidity;
  f64 deb;
  f64 PA;
  f64 K;
  f64 capital_value;
  f64 P;
  f64 Y_prev;
  f64 Yd;
  f64 Y;
  f64 stock;
  f64 x;
  f64 barK;
  f64 barYK;
  f64 Leff;
  f64 interest_r;
};

// capital-good producers hold no physical capital of their own
struct CapitalFirm {
  i32 firm_id;
  f64 A_k;
  f64 liquidity_k;
  f64 deb_k;
  f64 PA;
  f64 P_k;
  f64 Y_prev_k;
  f64 Y_kd;
  f64 Y_k;
  f64 stock_k;
  f64 Leff_k;
  f64 interest_r_k;
};

struct Worker {
  i32 worker_id;
  i32 Oc;
  f64 w;
};

struct Bank {
  f64 profitsB;
  f64 loans;
  f64 E;
};

struct Aggregates {
  i32 defaults;
  i32 defaults_k;
  f64 price_k;
  f64 wb;
};

struct Params {
  f64 k;
  f64 alpha;
  f64 r_f;
};

struct ModelState {
  std::vector<ConsumptionFirm> consumption_firms;
  std::vector<CapitalFirm> capital_firms;
  std::vector<Worker> workers;
  Bank bank;
  Aggregates agg;
  Params params;
};

ModelState make_state(i32 n_cons, i32 n_cap, i32 n_workers);

i32 count_unemployed(const ModelState& model);

}
