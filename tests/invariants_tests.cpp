#include <gtest/gtest.h>
#include "macrosim/invariants.hpp"
#include "macrosim/bankruptcy.hpp"
#include "macrosim/config.hpp"
#include "macrosim/constants.hpp"
#include <limits>

using namespace macrosim;

namespace {

ModelState small_model() {
    ModelState m = make_state(2, 1, 2);
    m.params = Params{2.0, 1.0, 0.01};
    m.agg.price_k = 1.0;
    m.agg.wb = 1.0;
    m.bank = Bank{0.0, 50.0, 20.0};

    auto& f1 = m.consumption_firms[0];
    f1.A = -3.0; f1.liquidity = 2.0; f1.deb = 30.0; f1.PA = 1.0; f1.K = 4.0; f1.P = 1.0; f1.Y_prev = 6.0;
    auto& f2 = m.consumption_firms[1];
    f2.A = 10.0; f2.liquidity = 8.0; f2.deb = 2.0; f2.K = 4.0; f2.P = 1.0; f2.Y_prev = 5.0;
    auto& c = m.capital_firms[0];
    c.A_k = 5.0; c.liquidity_k = 5.0; c.P_k = 2.0; c.Y_prev_k = 3.0;

    m.workers[0] = Worker{1, 1, 1.0};
    m.workers[1] = Worker{2, 3, 1.0};
    return m;
}

}

TEST(InvariantsTest, HoldAfterSweep) {
    ModelState m = small_model();
    firms_go_bankrupt(m);
    check_invariants(m, 0);
    SUCCEED();
}

TEST(InvariantsDeathTest, LeftoverNegativeNetWorthIsFatal) {
    ModelState m = small_model();
    EXPECT_EXIT(check_invariants(m, 4), ::testing::ExitedWithCode(1), "invariant fail step=4 consumption firm 1 negative A");
}

TEST(InvariantsDeathTest, NonFiniteBankIsFatal) {
    ModelState m = small_model();
    firms_go_bankrupt(m);
    m.bank.E = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EXIT(check_invariants(m, 1), ::testing::ExitedWithCode(1), "invariant fail step=1 bank non-finite E");
}

TEST(InvariantsDeathTest, UnemployedWorkerWithWageIsFatal) {
    ModelState m = small_model();
    firms_go_bankrupt(m);
    m.workers[1].Oc = UNEMPLOYED;
    EXPECT_EXIT(check_invariants(m, 2), ::testing::ExitedWithCode(1), "invariant fail step=2 unemployed worker 2 has wage");
}

// Any scenario accepted by validate_config must survive the post-sweep checks.
TEST(InvariantsTest, HoldForValidatedScenario) {
    auto cfg = parse_config(R"({
      "params": { "k": 2.0, "alpha": 1.0, "r_f": 0.01 },
      "agg": { "price_k": 1.0, "wb": 1.0 },
      "bank": { "profitsB": 0.0, "loans": 50.0, "E": 20.0 },
      "consumption_firms": [
        { "firm_id": 1, "A": -3.0, "liquidity": 2.0, "deb": 30.0, "PA": 0.0, "K": 4.0, "P": 1.0, "Y_prev": 6.0 },
        { "firm_id": 2, "A": -1.0, "liquidity": 1.0, "deb": 9.0, "K": 0.0, "P": 2.0, "Y_prev": 3.0 }
      ],
      "capital_firms": [
        { "firm_id": 3, "A_k": -2.0, "liquidity_k": 1.0, "deb_k": 4.0, "P_k": 2.0, "Y_prev_k": 3.0 }
      ],
      "workers": [ { "worker_id": 1, "Oc": 1, "w": 1.0 }, { "worker_id": 2, "Oc": 3, "w": 1.0 } ]
    })");
    validate_config(cfg);
    ModelState m = init_model(cfg);

    testing::internal::CaptureStdout();
    firms_go_bankrupt(m);
    testing::internal::GetCapturedStdout();

    check_invariants(m, 0);
    EXPECT_EQ(m.agg.defaults, 2);
    EXPECT_EQ(m.agg.defaults_k, 1);
    EXPECT_GE(m.consumption_firms[0].A, 0.0);
    EXPECT_GE(m.consumption_firms[1].A, 0.0);
    EXPECT_GE(m.capital_firms[0].A_k, 0.0);
}
