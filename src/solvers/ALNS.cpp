#include "ALNS.h"
#include "../core/SolverFactory.h"
#include "AdaptiveLNS.h"
#include <iostream>
#include <sstream>

namespace { SolverRegistrar<ALNS> registrar("alns", "adaptive random/Shaw removal with best/regret insertion"); }

Solution ALNS::solve(const std::shared_ptr<const VRPInstance>& instance, const SolveParams& params,
                     std::mt19937& gen, int verbose, search::ConvergenceHistory* history) {
    Solution initial = search::initial_solution(*instance, params, gen, verbose);
    AdaptiveLNS engine(instance, initial, params, gen, verbose);
    if (verbose >= 1) {
        std::ostringstream line;
        line << "[ALNS] start cost=" << initial.cost() << " customers=" << instance->num_customers - 1
             << " vehicles=" << instance->num_vehicles << "\n";
        std::cout << line.str() << std::flush;
    }
    return search::run(engine, params, gen, verbose, history);
}
