#include "macrosim/state.hpp"
#include "macrosim/constants.hpp"

namespace macrosim {

ModelState make_state(i32 n_cons, i32 n_cap, i32 n_workers) {
  ModelState model;
  model.consumption_firms.resize((std::size_t)n_cons, ConsumptionFirm{});
  model.capital_firms.resize((std::size_t)n_cap, CapitalFirm{});
  model.workers.resize((std::size_t)n_workers, Worker{});

  for (i32 i = 0; i < n_cons; ++i) model.consumption_firms[(std::size_t)i].firm_id = i + 1;
  for (i32 i = 0; i < n_cap; ++i) model.capital_firms[(std::size_t)i].firm_id = n_cons + i + 1;
  for (i32 i = 0; i < n_workers; ++i) {
    auto& wk = model.workers[(std::size_t)i];
    wk.worker_id = i + 1;
    wk.Oc = UNEMPLOYED;
    wk.w = 0.0;
  }

  model.bank = Bank{};
  model.agg = Aggregates{};
  model.params = Params{};
  return model;
}

i32 count_unemployed(const ModelState& model) {
  i32 n = 0;
  for (const auto& wk : model.workers) if (wk.Oc == UNEMPLOYED) n += 1;
  return n;
}

}
