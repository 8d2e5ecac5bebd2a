#include "AdaptiveLNS.h"
#include <iostream>
#include <sstream>

AdaptiveLNS::AdaptiveLNS(std::shared_ptr<const VRPInstance> instance, const Solution& initial_solution,
                         const SolveParams& params, std::mt19937& gen, int verbose)
    : LNSSolver(std::move(instance), initial_solution, params, gen, verbose),
      destroy_ops_(2, params.reaction_factor, params.min_weight),
      repair_ops_(2, params.reaction_factor, params.min_weight) {}

RemovedStops AdaptiveLNS::destroy() {
    int op = destroy_ops_.select(gen_);
    last_destroy_op_ = op;
    if (op == kRandomRemoval) {
        return operators::remove_random(current_, tabu_, params_.destroy_size, gen_);
    }
    return operators::remove_shaw(current_, tabu_, *instance_, params_.destroy_size,
                                  params_.shaw_alpha, params_.shaw_beta, gen_);
}

bool AdaptiveLNS::repair(const RemovedStops& removed, std::vector<int>& routes_used) {
    int op = repair_ops_.select(gen_);
    if (verbose_ >= 3) {
        std::ostringstream line;
        line << "[ALNS] destroy_op=" << last_destroy_op_ << " repair_op=" << op << "\n";
        std::cout << line.str();
    }
    if (op == kBestInsertion) {
        return operators::reinsert_best(current_, removed, params_.insertion_noise, gen_, &routes_used);
    }
    return operators::reinsert_regret(current_, removed, params_.regret_k, params_.insertion_noise, gen_, &routes_used);
}

void AdaptiveLNS::update_scores(double delta) {
    destroy_ops_.reward(delta);
    repair_ops_.reward(delta);
}

void AdaptiveLNS::update_weights() {
    destroy_ops_.update_weights();
    repair_ops_.update_weights();
    if (verbose_ >= 2) {
        std::ostringstream line;
        line << "[ALNS] weights destroy=(" << destroy_ops_.operators()[0].weight << ", "
             << destroy_ops_.operators()[1].weight << ") repair=(" << repair_ops_.operators()[0].weight
             << ", " << repair_ops_.operators()[1].weight << ")\n";
        std::cout << line.str();
    }
}
