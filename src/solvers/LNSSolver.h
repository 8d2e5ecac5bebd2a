#pragma once
#include <memory>
#include <random>
#include <vector>
#include "../core/Solution.h"
#include "../core/VRPInstance.h"
#include "Operators.h"
#include "SolveParams.h"
#include "SolveStats.h"
#include "TabuPool.h"

// Destroy/repair engine driven by search::run. Owns the working solution and
// the tabu pool; concrete engines supply the destroy and repair steps.
class LNSSolver {
public:
    LNSSolver(std::shared_ptr<const VRPInstance> instance, const Solution& initial_solution,
              const SolveParams& params, std::mt19937& gen, int verbose = 0);
    virtual ~LNSSolver() = default;

    const VRPInstance& instance() const { return *instance_; }
    const Solution& current() const { return current_; }
    double cost() const { return current_.cost(); }

    // Destroy, queue the removed customers as tabu, repair. Returns false when
    // repair could not place a stop; current() must then be put back with
    // restore().
    bool find_new_solution();

    // Copies `sol` into the working solution and clears the tabu queue.
    void jump_to_solution(const Solution& sol);
    // Copies `sol` back after a rejected or failed move; the tabu queue is kept.
    virtual void restore(const Solution& sol) { current_ = sol; }

    // Reward for the operators used in the last iteration.
    virtual void update_scores(double delta) { (void)delta; }
    virtual void update_weights() {}
    virtual const char* name() const = 0;

    SolveStats& stats() { return stats_; }
    const TabuPool& tabu() const { return tabu_; }

protected:
    virtual RemovedStops destroy() = 0;
    virtual bool repair(const RemovedStops& removed, std::vector<int>& routes_used) = 0;

    std::shared_ptr<const VRPInstance> instance_;
    SolveParams params_;
    std::mt19937& gen_;
    int verbose_;
    Solution current_;
    TabuPool tabu_;
    SolveStats stats_;
};
