#include "Solution.h"
#include <iomanip>
#include <limits>
#include <sstream>

Solution::Solution(const VRPInstance& instance) : instance_(&instance) {
    routes.reserve(instance.num_vehicles);
    for (int i = 0; i < instance.num_vehicles; ++i) {
        routes.emplace_back(instance, i);
    }
}

double Solution::cost() const {
    double total = 0.0;
    for (const auto& r : routes) total += r.cost();
    return total;
}

int Solution::num_nonempty_routes() const {
    int count = 0;
    for (const auto& r : routes) {
        if (!r.empty()) ++count;
    }
    return count;
}

int Solution::route_index_of(int cust_no) const {
    for (int i = 0; i < (int)routes.size(); ++i) {
        if (routes[i].contains_stop(cust_no)) return i;
    }
    return -1;
}

bool Solution::is_valid_solution(std::string* reason) const {
    auto fail = [&](const std::string& msg) {
        if (reason) *reason = msg;
        return false;
    };
    if (!instance_) return fail("solution is not bound to an instance");
    if ((int)routes.size() != instance_->num_vehicles) {
        return fail("expected " + std::to_string(instance_->num_vehicles) + " routes, got " + std::to_string(routes.size()));
    }
    std::vector<int> seen(instance_->num_customers, 0);
    for (const auto& r : routes) {
        if (r.used_capacity() > instance_->vehicle_capacity) {
            return fail("route " + r.to_string() + " is over capacity " + std::to_string(instance_->vehicle_capacity));
        }
        if (!r.is_consistent()) {
            return fail("route " + r.to_string() + " has inconsistent cached state");
        }
        for (const auto& s : r.stops()) {
            if (s.cust_no <= 0 || s.cust_no >= instance_->num_customers) {
                return fail("route " + r.to_string() + " holds unknown customer " + std::to_string(s.cust_no));
            }
            if (++seen[s.cust_no] > 1) {
                return fail("customer " + std::to_string(s.cust_no) + " is visited more than once");
            }
        }
    }
    for (int c = 1; c < instance_->num_customers; ++c) {
        if (seen[c] == 0) return fail("customer " + std::to_string(c) + " isn't visited");
    }
    return true;
}

static void write_route(std::ostringstream& oss, const Route& route) {
    oss << "0";
    for (const auto& s : route.stops()) oss << " " << s.cust_no;
    oss << " 0";
}

std::string Solution::to_string() const {
    std::ostringstream oss;
    for (size_t i = 0; i < routes.size(); ++i) {
        if (i > 0) oss << " ";
        write_route(oss, routes[i]);
    }
    return oss.str();
}

std::string Solution::to_file_string() const {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << cost() << " " << routes.size() << "\n";
    for (const auto& r : routes) {
        write_route(oss, r);
        oss << "\n";
    }
    return oss.str();
}
