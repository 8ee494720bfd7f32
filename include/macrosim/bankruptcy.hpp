#pragma once
#include <vector>
#include "macrosim/state.hpp"

namespace macrosim {

    // Books the residual (liquidity - debt) of a liquidated firm as a bank loss/gain
    // and removes its debt from the loan book.
    void write_off_firm_debt(Bank& bank, f64 liquidity, f64 debt);

    // Returns the number of workers released.
    i32 release_workforce(i32 firm_id, std::vector<Worker>& workers);

    void firm_fires_all_workers(ConsumptionFirm& firm, std::vector<Worker>& workers);
    void firm_fires_all_workers(CapitalFirm& firm, std::vector<Worker>& workers);

    // Liquidates firm and restarts it in place as a new entrant. firm must belong to model.
    void firm_goes_bankrupt(ConsumptionFirm& firm, ModelState& model);
    void firm_goes_bankrupt(CapitalFirm& firm, ModelState& model);

    // Consumption firms first, then capital firms, each in population order. A firm reset
    // earlier in the sweep is already visible to the statistics of later ones.
    void firms_go_bankrupt(ModelState& model);

}
