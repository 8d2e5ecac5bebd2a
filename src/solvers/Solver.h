#pragma once

#include "../core/Solution.h"
#include "../core/VRPInstance.h"
#include "Search.h"
#include "SolveParams.h"
#include <memory>
#include <random>

class Solver {
public:
    virtual ~Solver() = default;
    // Builds (or takes params.initial_solution as) a starting point and runs the
    // search on it. `history`, when given, receives the best-cost convergence samples.
    virtual Solution solve(const std::shared_ptr<const VRPInstance>& instance, const SolveParams& params,
                           std::mt19937& gen, int verbose = 0, search::ConvergenceHistory* history = nullptr) = 0;
};
