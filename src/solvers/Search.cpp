#include "Search.h"
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "../construct.h"
#include "../jump.h"
#include "LocalSearch.h"

namespace search {

Solution initial_solution(const VRPInstance& instance, const SolveParams& params, std::mt19937& gen, int verbose) {
    if (params.initial_solution) {
        std::string reason;
        if (params.initial_solution->instance() != &instance || !params.initial_solution->is_valid_solution(&reason)) {
            throw std::invalid_argument("initial solution rejected: " + (reason.empty() ? "built for another instance" : reason));
        }
        return *params.initial_solution;
    }
    Solution sol = construct::build(params.constructor, instance, gen, verbose);
    if (verbose >= 1) {
        std::ostringstream line;
        line << "[construct] " << construct::constructor_name(params.constructor)
             << " initial cost=" << sol.cost() << " routes=" << sol.num_nonempty_routes() << "\n";
        std::cout << line.str();
    }
    return sol;
}

Solution run(LNSSolver& solver, const SolveParams& params, std::mt19937& gen, int verbose,
             ConvergenceHistory* history) {
    const VRPInstance& instance = solver.instance();
    const std::string tag = std::string("[") + solver.name() + "] ";
    std::bernoulli_distribution revert(1.0 - params.accept_worse_prob);
    std::bernoulli_distribution jump_from_recent(params.jump_from_recent_prob);

    Solution best = solver.current();
    Solution best_for_jump = best;
    double best_cost = best.cost();
    double best_cost_for_jump = best_cost;
    double last_cost = best_cost;
    int stagnant_iterations = 0;

    Solution old_solution = best;
    auto start = std::chrono::steady_clock::now();
    if (history) history->emplace_back(0, best_cost);

    long long iter = 0;
    for (;; ++iter) {
        if (history && params.history_interval > 0 && iter > 0 && iter % params.history_interval == 0) {
            history->emplace_back(iter, best_cost);
        }
        if (params.terminate.kind == TermCond::Kind::MaxIters) {
            if (iter >= params.terminate.max_iters) break;
        } else if (std::chrono::steady_clock::now() - start > params.terminate.time_limit) {
            break;
        }

        old_solution = solver.current();
        if (!solver.find_new_solution()) {
            // Locally infeasible neighbourhood: drop the move and carry on.
            solver.restore(old_solution);
            continue;
        }

        const double new_cost = solver.cost();
        solver.stats().update_on_iter(iter, new_cost, best_cost - new_cost);

        if (new_cost + params.improvement_eps < best_cost_for_jump) {
            best_for_jump = solver.current();
            best_cost_for_jump = new_cost;
        }
        const bool new_best = new_cost + params.improvement_eps < best_cost;
        if (new_best) {
            best = solver.current();
            if (params.polish_with_swaps) local_search::polish_with_swaps(best, gen);
            best_cost = best.cost();
            if (verbose >= 2) {
                std::ostringstream line;
                line << tag << "iter " << iter << " new best: " << best_cost << "\n";
                std::cout << line.str();
            }
        }

        const bool improved = new_cost + params.improvement_eps < last_cost;
        if (new_best) {
            solver.update_scores(params.reward_best);
        } else if (improved) {
            solver.update_scores(params.reward_improve);
        } else {
            solver.update_scores(params.reward_other);
        }
        if (solver.stats().iterations % params.weight_interval == 0) solver.update_weights();

        if (improved || new_best) {
            stagnant_iterations = 0;
        } else {
            ++stagnant_iterations;
            if (revert(gen)) solver.restore(old_solution);
        }
        last_cost = new_cost;

        if (verbose >= 2 && iter % 10000 == 0) {
            std::ostringstream line;
            line << tag << "iter " << iter << " current=" << solver.cost() << " best=" << best_cost << "\n";
            std::cout << line.str();
        }

        if (stagnant_iterations > params.patience) {
            stagnant_iterations = 0;
            const bool from_recent = jump_from_recent(gen);
            if (verbose >= 2) {
                std::ostringstream line;
                line << tag << "restarting from " << (from_recent ? "jump best " : "global best ")
                     << (from_recent ? best_cost_for_jump : best_cost) << "\n";
                std::cout << line.str();
            }
            Solution new_sol = jump::apply(params.jumper, instance, from_recent ? best_for_jump : best,
                                           params.frac_dropped, gen, verbose);
            solver.stats().on_restart(iter);
            best_cost_for_jump = new_sol.cost();
            best_for_jump = new_sol;
            if (best_cost_for_jump + params.improvement_eps < best_cost) {
                best = new_sol;
                best_cost = best_cost_for_jump;
            }
            last_cost = best_cost_for_jump;
            solver.jump_to_solution(new_sol);
        }
    }

    if (verbose >= 1) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::ostringstream summary;
        summary << tag << "ran for " << elapsed << "s, got through " << iter << " iters, best=" << best_cost << "\n";
        if (verbose >= 2) solver.stats().print(summary);
        std::cout << summary.str();
    }
    return best;
}

} // namespace search
