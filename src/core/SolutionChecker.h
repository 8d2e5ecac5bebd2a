#pragma once
#include <string>
#include <vector>
#include "Solution.h"
#include "VRPInstance.h"

struct CheckResult {
    bool ok = true;
    double recomputed_cost = 0.0;
    std::string message;
};

class SolutionChecker {
public:
    // Splits a "0 a b 0 0 c 0" route string into its non-empty routes.
    // Throws std::runtime_error on a non-numeric token.
    static std::vector<std::vector<int>> parse_routes(const std::string& route_string);

    // Re-validates routes against the raw coordinates: coverage, capacity and
    // claimed cost (within 0.1). A negative claimed_cost skips the cost check.
    static CheckResult check(const VRPInstance& instance, const std::vector<std::vector<int>>& routes,
                             double claimed_cost = -1.0);

    // Rebuilds a Solution from parsed routes; throws std::runtime_error when
    // there are more routes than vehicles.
    static Solution to_solution(const VRPInstance& instance, const std::vector<std::vector<int>>& routes);
};
