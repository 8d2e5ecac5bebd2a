#include "LNS.h"
#include "../core/SolverFactory.h"
#include "RandomLNS.h"

namespace { SolverRegistrar<LNS> registrar("lns", "random removal with best insertion"); }

Solution LNS::solve(const std::shared_ptr<const VRPInstance>& instance, const SolveParams& params,
                    std::mt19937& gen, int verbose, search::ConvergenceHistory* history) {
    Solution initial = search::initial_solution(*instance, params, gen, verbose);
    RandomLNS engine(instance, initial, params, gen, verbose);
    return search::run(engine, params, gen, verbose, history);
}
