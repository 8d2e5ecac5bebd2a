#pragma once
#include <random>
#include <string>
#include "core/Solution.h"
#include "core/VRPInstance.h"

namespace construct {

enum class ConstructorKind {
    ClarkeWrightThenSweep,
    SweepThenClarkeWright,
    Greedy,
    CheapestInsertion,
};

// Throws std::invalid_argument for an unknown name.
ConstructorKind constructor_from_name(const std::string& name);
std::string constructor_name(ConstructorKind kind);

// Always returns a feasible solution; throws std::runtime_error when even the
// greedy fallback cannot place every customer.
Solution build(ConstructorKind kind, const VRPInstance& instance, std::mt19937& gen, int verbose = 0);

// Descending demand, first vehicle with room. Throws std::runtime_error on failure.
Solution greedy(const VRPInstance& instance);

// Shuffled customers, each at its cheapest feasible position. Throws std::runtime_error on failure.
Solution cheapest_insertion(const VRPInstance& instance, std::mt19937& gen);

// Polar-angle order with a random rotation, first-fit into vehicles.
bool sweep(const VRPInstance& instance, std::mt19937& gen, Solution& out);

// Savings merge with Normal(1, 1) noise per pair; fails when more than
// num_vehicles routes remain.
bool clarke_wright(const VRPInstance& instance, std::mt19937& gen, Solution& out);

// Clarke-Wright up to 5 times, sweep up to 50 times, then greedy.
Solution clarke_wright_and_then_sweep(const VRPInstance& instance, std::mt19937& gen, int verbose = 0);
// Sweep up to 50 times, Clarke-Wright up to 5 times, then greedy.
Solution sweep_then_clarke_wright(const VRPInstance& instance, std::mt19937& gen, int verbose = 0);

double polar_angle(const VRPInstance& instance, int cust_no);

} // namespace construct
