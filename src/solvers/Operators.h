#pragma once
#include <random>
#include <utility>
#include <vector>
#include "../core/Solution.h"
#include "../core/VRPInstance.h"
#include "TabuPool.h"

// Each removed stop paired with the index of the route it was taken from.
using RemovedStops = std::vector<std::pair<Stop, int>>;

namespace operators {

// Takes cust_no out of whichever route holds it and appends it to `out`.
bool extract_customer(Solution& sol, int cust_no, RemovedStops& out);

// ---- Destroy ----------------------------------------------------------------
// Both take min(n, pool.eligible_count()) customers out of the eligible pool;
// the caller queues them as tabu afterwards.

// n customers drawn uniformly without replacement.
RemovedStops remove_random(Solution& sol, TabuPool& pool, int n, std::mt19937& gen);

// A random eligible seed plus the eligible customers closest to it by
// alpha * distance + beta * |demand difference|.
RemovedStops remove_shaw(Solution& sol, TabuPool& pool, const VRPInstance& instance, int n,
                         double alpha, double beta, std::mt19937& gen);

// ---- Repair -----------------------------------------------------------------

// Commits `stop` at the cheapest feasible (route, position); with probability
// noise_prob at a uniformly chosen feasible one instead. Returns the route
// index, or -1 when no feasible position exists.
int reinsert_in_best_spot(Solution& sol, const Stop& stop, double noise_prob, std::mt19937& gen);

// Descending demand, each at its best spot. False as soon as a stop cannot be placed.
bool reinsert_best(Solution& sol, const RemovedStops& removed, double noise_prob, std::mt19937& gen,
                   std::vector<int>* routes_used = nullptr);

// k-th cheapest minus cheapest feasible insertion increase over all routes and
// positions; +infinity when fewer than k feasible positions exist.
double regret_k(const Solution& sol, const Stop& stop, int k);

// Descending regret (ties keep removal order), each at its best spot.
bool reinsert_regret(Solution& sol, const RemovedStops& removed, int k, double noise_prob, std::mt19937& gen,
                     std::vector<int>* routes_used = nullptr);

} // namespace operators
