#pragma once
#include "Solver.h"

// Adaptive LNS: roulette-wheel choice between random/Shaw removal and
// best/regret insertion, with tabu-filtered destroy and jump restarts.
class ALNS : public Solver {
public:
    Solution solve(const std::shared_ptr<const VRPInstance>& instance, const SolveParams& params,
                   std::mt19937& gen, int verbose = 0, search::ConvergenceHistory* history = nullptr) override;
};
