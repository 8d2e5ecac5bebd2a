#include "MultiStart.h"
#include <omp.h>
#include <chrono>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include "../core/SolverFactory.h"
#include "../utils.h"

MultiStartResult solve_multi_start(const std::string& solver_name, const std::shared_ptr<const VRPInstance>& instance,
                             const SolveParams& params, int num_runs, int num_threads,
                             bool alternate_constructors, int verbose, bool record_history) {
    if (num_runs < 1) throw std::invalid_argument("num_runs must be at least 1");
    if (!SolverFactory::create(solver_name)) {
        throw std::invalid_argument("Unknown or unregistered solver: " + solver_name);
    }
    const unsigned int base_seed = utils::resolve_seed(params.seed);
    if (verbose >= 1) {
        std::cout << "[multi-start] " << num_runs << " runs of '" << solver_name << "', base seed " << base_seed << std::endl;
    }

    MultiStartResult result;
    result.run_costs.assign(num_runs, std::numeric_limits<double>::infinity());
    result.run_times.assign(num_runs, 0.0);
    std::vector<std::string> errors(num_runs);
    double best_cost = std::numeric_limits<double>::infinity();

    const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
    #pragma omp parallel for num_threads(threads) schedule(dynamic)
    for (int run = 0; run < num_runs; ++run) {
        try {
            SolveParams run_params = params;
            run_params.seed = base_seed + static_cast<unsigned int>(run);
            if (alternate_constructors) {
                run_params.constructor = (run % 3 == 0) ? construct::ConstructorKind::SweepThenClarkeWright
                                                        : construct::ConstructorKind::ClarkeWrightThenSweep;
            }
            std::mt19937 gen(run_params.seed);
            std::unique_ptr<Solver> solver = SolverFactory::create(solver_name);
            search::ConvergenceHistory history;

            auto start = std::chrono::steady_clock::now();
            Solution sol = solver->solve(instance, run_params, gen, verbose, record_history ? &history : nullptr);
            double runtime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            double cost = sol.cost();

            #pragma omp critical
            {
                result.run_costs[run] = cost;
                result.run_times[run] = runtime;
                if (cost < best_cost || (cost == best_cost && run < result.best_run)) {
                    best_cost = cost;
                    result.best = std::move(sol);
                    result.best_run = run;
                    result.history = std::move(history);
                }
                if (verbose >= 1) {
                    std::cout << "  Run " << (run + 1) << " (thread " << omp_get_thread_num() << "): Obj = " << cost
                              << ", Time = " << runtime << "s" << std::endl;
                }
            }
        } catch (const std::exception& e) {
            errors[run] = e.what();
        }
    }

    for (int run = 0; run < num_runs; ++run) {
        if (!errors[run].empty()) {
            throw std::runtime_error("run " + std::to_string(run + 1) + " failed: " + errors[run]);
        }
    }
    return result;
}
