#include "SolutionChecker.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

std::vector<std::vector<int>> SolutionChecker::parse_routes(const std::string& route_string) {
    std::vector<std::vector<int>> routes;
    std::vector<int> route;
    std::istringstream iss(route_string);
    std::string token;
    while (iss >> token) {
        int cust_no = 0;
        try {
            size_t pos = 0;
            cust_no = std::stoi(token, &pos);
            if (pos != token.size()) throw std::invalid_argument(token);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid customer number '" + token + "' in solution string");
        }
        if (cust_no == 0) {
            if (!route.empty()) routes.push_back(route);
            route.clear();
        } else {
            route.push_back(cust_no);
        }
    }
    if (!route.empty()) routes.push_back(route);
    return routes;
}

// Helper: coordinate distance, independent of the precomputed matrix
static double coord_dist(const VRPInstance& instance, int a, int b) {
    double dx = instance.x_coord_of_customer[a] - instance.x_coord_of_customer[b];
    double dy = instance.y_coord_of_customer[a] - instance.y_coord_of_customer[b];
    return std::sqrt(dx * dx + dy * dy);
}

CheckResult SolutionChecker::check(const VRPInstance& instance, const std::vector<std::vector<int>>& routes,
                                   double claimed_cost) {
    CheckResult res;
    auto fail = [&](const std::string& msg) {
        res.ok = false;
        res.message = msg;
        return res;
    };
    if ((int)routes.size() > instance.num_vehicles) {
        return fail("uses " + std::to_string(routes.size()) + " routes but only " +
                    std::to_string(instance.num_vehicles) + " vehicles exist");
    }
    std::vector<int> seen(instance.num_customers, 0);
    for (const auto& route : routes) {
        int demand_served = 0;
        double distance = 0.0;
        int prev = 0;
        for (int cust_no : route) {
            if (cust_no <= 0 || cust_no >= instance.num_customers) {
                return fail("unknown customer " + std::to_string(cust_no));
            }
            if (++seen[cust_no] > 1) {
                return fail("customer " + std::to_string(cust_no) + " visited more than once");
            }
            demand_served += instance.demand_of_customer[cust_no];
            distance += coord_dist(instance, prev, cust_no);
            prev = cust_no;
        }
        distance += coord_dist(instance, prev, 0);
        if (demand_served > instance.vehicle_capacity) {
            return fail("route over capacity (" + std::to_string(demand_served) + " > " +
                        std::to_string(instance.vehicle_capacity) + ")");
        }
        res.recomputed_cost += distance;
    }
    for (int c = 1; c < instance.num_customers; ++c) {
        if (seen[c] == 0) return fail("customer " + std::to_string(c) + " isn't in the final routes");
    }
    if (claimed_cost >= 0.0 && std::abs(res.recomputed_cost - claimed_cost) > 0.1) {
        return fail("claimed cost " + std::to_string(claimed_cost) + " differs from recomputed " +
                    std::to_string(res.recomputed_cost));
    }
    return res;
}

Solution SolutionChecker::to_solution(const VRPInstance& instance, const std::vector<std::vector<int>>& routes) {
    if ((int)routes.size() > instance.num_vehicles) {
        throw std::runtime_error("solution has more routes than vehicles");
    }
    Solution sol(instance);
    for (size_t r = 0; r < routes.size(); ++r) {
        for (int cust_no : routes[r]) {
            if (cust_no <= 0 || cust_no >= instance.num_customers) {
                throw std::runtime_error("unknown customer " + std::to_string(cust_no));
            }
            Route& route = sol.routes[r];
            route.add_stop_to_index(Stop(cust_no, instance.demand_of_customer[cust_no]), route.size());
        }
    }
    return sol;
}
