#include "jump.h"
#include <algorithm>
#include <iostream>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace jump {

static constexpr int kJumpAttempts = 5;

JumpKind jump_from_name(const std::string& name) {
    if (name == "random_jump") return JumpKind::RandomJump;
    if (name == "random_jump_first_fit") return JumpKind::RandomJumpFirstFit;
    throw std::invalid_argument("Unknown jumper: " + name);
}

std::string jump_name(JumpKind kind) {
    switch (kind) {
        case JumpKind::RandomJump: return "random_jump";
        case JumpKind::RandomJumpFirstFit: return "random_jump_first_fit";
    }
    return "unknown";
}

bool random_drop(const VRPInstance& instance, const Solution& existing, double frac_dropped,
                 bool first_fit, std::mt19937& gen, Solution& out) {
    const int num_custs = instance.num_customers - 1;
    int to_remove = (int)(instance.num_customers * frac_dropped);
    to_remove = std::max(0, std::min(to_remove, num_custs));

    std::vector<int> removed_cust_nos(num_custs);
    std::iota(removed_cust_nos.begin(), removed_cust_nos.end(), 1);
    std::shuffle(removed_cust_nos.begin(), removed_cust_nos.end(), gen);
    removed_cust_nos.resize(to_remove);

    std::vector<char> dropped(instance.num_customers, 0);
    for (int c : removed_cust_nos) dropped[c] = 1;

    Solution sol = existing;
    for (auto& r : sol.routes) {
        r.retain_stops([&](const Stop& s) { return !dropped[s.cust_no]; });
    }

    std::vector<Stop> to_add;
    to_add.reserve(removed_cust_nos.size());
    for (int c : removed_cust_nos) to_add.emplace_back(c, instance.demand_of_customer[c]);
    std::stable_sort(to_add.begin(), to_add.end(), [](const Stop& a, const Stop& b) { return a.demand > b.demand; });

    std::shuffle(sol.routes.begin(), sol.routes.end(), gen);

    for (const Stop& s : to_add) {
        int best_route = -1, best_index = -1;
        double best_delta = std::numeric_limits<double>::max();
        for (int r = 0; r < (int)sol.routes.size(); ++r) {
            const Route& route = sol.routes[r];
            if (route.used_capacity() + s.demand > instance.vehicle_capacity) continue;
            BestInsertion ins = route.speculative_add_best(s);
            double delta = ins.result.cost - route.cost();
            if (delta < best_delta) {
                best_delta = delta;
                best_route = r;
                best_index = ins.index;
            }
            if (first_fit) break;
        }
        if (best_route == -1) return false;
        sol.routes[best_route].add_stop_to_index(s, best_index);
    }
    out = std::move(sol);
    return true;
}

Solution random_jump(const VRPInstance& instance, const Solution& existing, double frac_dropped,
                     std::mt19937& gen, bool first_fit, int verbose) {
    if (verbose >= 2) {
        std::ostringstream line;
        line << "[jump] random drop of " << frac_dropped * 100.0 << "% of customers"
             << (first_fit ? " (first fit)" : "") << "\n";
        std::cout << line.str();
    }
    Solution sol;
    for (int attempt = 0; attempt < kJumpAttempts; ++attempt) {
        if (random_drop(instance, existing, frac_dropped, first_fit, gen, sol)) return sol;
    }
    throw std::runtime_error("random_jump failed after " + std::to_string(kJumpAttempts) + " attempts");
}

Solution apply(JumpKind kind, const VRPInstance& instance, const Solution& existing, double frac_dropped,
               std::mt19937& gen, int verbose) {
    return random_jump(instance, existing, frac_dropped, gen, kind == JumpKind::RandomJumpFirstFit, verbose);
}

} // namespace jump
