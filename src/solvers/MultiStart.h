#pragma once
#include <memory>
#include <string>
#include <vector>
#include "../core/Solution.h"
#include "../core/VRPInstance.h"
#include "Search.h"
#include "SolveParams.h"

struct MultiStartResult {
    Solution best;
    int best_run = -1;
    std::vector<double> run_costs;      // best cost per run, indexed by run
    std::vector<double> run_times;      // seconds per run
    search::ConvergenceHistory history; // of the winning run, when requested
};

// Runs `num_runs` independent searches of the registered solver `solver_name`
// on up to `num_threads` OpenMP threads (0 keeps the OpenMP default). Run i is
// seeded with seed + i; with alternate_constructors set, every third run starts
// from sweep_then_clarke_wright and the others from clarke_wright_then_sweep.
// Throws std::invalid_argument for an unknown solver and rethrows the first
// failure of any run as std::runtime_error once all runs have finished.
MultiStartResult solve_multi_start(const std::string& solver_name, const std::shared_ptr<const VRPInstance>& instance,
                             const SolveParams& params, int num_runs, int num_threads,
                             bool alternate_constructors, int verbose = 0, bool record_history = false);
