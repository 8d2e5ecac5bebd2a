#pragma once
#include <random>
#include <utility>
#include <vector>
#include "../core/Solution.h"
#include "LNSSolver.h"
#include "SolveParams.h"

namespace search {

// (iteration, best cost) samples taken every params.history_interval iterations.
using ConvergenceHistory = std::vector<std::pair<long long, double>>;

// The warm start from params when present (throws std::invalid_argument if it
// is not a valid solution of `instance`), otherwise the configured constructor.
Solution initial_solution(const VRPInstance& instance, const SolveParams& params, std::mt19937& gen, int verbose = 0);

// Iterates destroy/repair on `solver` until the termination condition holds,
// accepting non-improving moves with params.accept_worse_prob and jumping after
// more than params.patience stagnant iterations. Returns the best solution seen.
Solution run(LNSSolver& solver, const SolveParams& params, std::mt19937& gen, int verbose = 0,
             ConvergenceHistory* history = nullptr);

} // namespace search
