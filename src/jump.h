#pragma once
#include <random>
#include <string>
#include "core/Solution.h"
#include "core/VRPInstance.h"

namespace jump {

enum class JumpKind {
    RandomJump,          // dropped stops go to the cheapest feasible slot over all routes
    RandomJumpFirstFit,  // dropped stops go to the first route with room, at its best slot
};

// Throws std::invalid_argument for an unknown name.
JumpKind jump_from_name(const std::string& name);
std::string jump_name(JumpKind kind);

// Drops floor(num_customers * frac_dropped) random customers from `existing`,
// shuffles the route order and reinserts the dropped stops by descending demand.
// Returns false (leaving `out` untouched) when a stop cannot be placed.
bool random_drop(const VRPInstance& instance, const Solution& existing, double frac_dropped,
                 bool first_fit, std::mt19937& gen, Solution& out);

// Up to 5 random_drop attempts; throws std::runtime_error when all fail.
Solution random_jump(const VRPInstance& instance, const Solution& existing, double frac_dropped,
                     std::mt19937& gen, bool first_fit = false, int verbose = 0);

Solution apply(JumpKind kind, const VRPInstance& instance, const Solution& existing, double frac_dropped,
               std::mt19937& gen, int verbose = 0);

} // namespace jump
