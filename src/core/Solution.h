#pragma once
#include <string>
#include <vector>
#include "Route.h"
#include "VRPInstance.h"

// One route per vehicle (some possibly empty). Every customer 1..num_customers-1
// belongs to exactly one route in a valid solution.
class Solution {
public:
    Solution() = default;
    explicit Solution(const VRPInstance& instance);

    std::vector<Route> routes;

    // Sum of the cached route costs.
    double cost() const;
    const VRPInstance* instance() const { return instance_; }

    int num_nonempty_routes() const;
    int route_index_of(int cust_no) const; // -1 when unassigned

    // All customers covered exactly once and every route within capacity.
    bool is_valid_solution(std::string* reason = nullptr) const;

    // "0 1 2 0 0 3 0": each route framed by depot markers, empty routes included.
    std::string to_string() const;
    // "<cost> <vehicles>\n" followed by one "0 ... 0" line per route.
    std::string to_file_string() const;

private:
    const VRPInstance* instance_ = nullptr;
};
