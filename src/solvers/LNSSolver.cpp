#include "LNSSolver.h"
#include <stdexcept>

LNSSolver::LNSSolver(std::shared_ptr<const VRPInstance> instance, const Solution& initial_solution,
                     const SolveParams& params, std::mt19937& gen, int verbose)
    : instance_(std::move(instance)), params_(params), gen_(gen), verbose_(verbose),
      current_(initial_solution), tabu_(instance_->num_customers) {}

bool LNSSolver::find_new_solution() {
    RemovedStops removed = destroy();
    stats_.record_removed(removed);

    std::vector<int> cust_nos;
    cust_nos.reserve(removed.size());
    for (const auto& entry : removed) cust_nos.push_back(entry.first.cust_no);
    tabu_.push_tabu(cust_nos);
#ifndef NDEBUG
    if (!tabu_.is_consistent()) throw std::logic_error("tabu pool no longer partitions the customers");
#endif

    std::vector<int> routes_used;
    routes_used.reserve(removed.size());
    if (!repair(removed, routes_used)) return false;
    stats_.record_added(routes_used);
    return true;
}

void LNSSolver::jump_to_solution(const Solution& sol) {
    current_ = sol;
    tabu_.reset();
}
