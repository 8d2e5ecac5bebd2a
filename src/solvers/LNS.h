#pragma once
#include "Solver.h"

// Plain LNS baseline: random removal and best insertion only.
class LNS : public Solver {
public:
    Solution solve(const std::shared_ptr<const VRPInstance>& instance, const SolveParams& params,
                   std::mt19937& gen, int verbose = 0, search::ConvergenceHistory* history = nullptr) override;
};
