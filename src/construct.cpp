#include "construct.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace construct {

static constexpr int kClarkeWrightAttempts = 5;
static constexpr int kSweepAttempts = 50;

ConstructorKind constructor_from_name(const std::string& name) {
    if (name == "clarke_wright_then_sweep" || name == "clarke_wright_and_then_sweep") return ConstructorKind::ClarkeWrightThenSweep;
    if (name == "sweep_then_clarke_wright") return ConstructorKind::SweepThenClarkeWright;
    if (name == "greedy") return ConstructorKind::Greedy;
    if (name == "cheapest_insertion") return ConstructorKind::CheapestInsertion;
    throw std::invalid_argument("Unknown constructor: " + name);
}

std::string constructor_name(ConstructorKind kind) {
    switch (kind) {
        case ConstructorKind::ClarkeWrightThenSweep: return "clarke_wright_then_sweep";
        case ConstructorKind::SweepThenClarkeWright: return "sweep_then_clarke_wright";
        case ConstructorKind::Greedy: return "greedy";
        case ConstructorKind::CheapestInsertion: return "cheapest_insertion";
    }
    return "unknown";
}

Solution build(ConstructorKind kind, const VRPInstance& instance, std::mt19937& gen, int verbose) {
    switch (kind) {
        case ConstructorKind::ClarkeWrightThenSweep: return clarke_wright_and_then_sweep(instance, gen, verbose);
        case ConstructorKind::SweepThenClarkeWright: return sweep_then_clarke_wright(instance, gen, verbose);
        case ConstructorKind::Greedy: return greedy(instance);
        case ConstructorKind::CheapestInsertion: return cheapest_insertion(instance, gen);
    }
    throw std::invalid_argument("Unhandled constructor kind");
}

// Appends every customer in order to the first vehicle with enough room.
static bool first_fit(const VRPInstance& instance, const std::vector<int>& customer_nos, Solution& sol) {
    for (int cust_no : customer_nos) {
        int demand = instance.demand_of_customer[cust_no];
        bool found = false;
        for (auto& route : sol.routes) {
            if (route.remaining_capacity() >= demand) {
                route.add_stop_to_index(Stop(cust_no, demand), route.size());
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

Solution greedy(const VRPInstance& instance) {
    std::vector<int> customer_nos(instance.num_customers - 1);
    std::iota(customer_nos.begin(), customer_nos.end(), 1);
    std::stable_sort(customer_nos.begin(), customer_nos.end(), [&](int a, int b) {
        return instance.demand_of_customer[a] > instance.demand_of_customer[b];
    });
    Solution sol(instance);
    if (!first_fit(instance, customer_nos, sol)) {
        throw std::runtime_error("greedy construction cannot fit all customers into " +
                                 std::to_string(instance.num_vehicles) + " vehicles");
    }
    return sol;
}

Solution cheapest_insertion(const VRPInstance& instance, std::mt19937& gen) {
    std::vector<int> customer_nos(instance.num_customers - 1);
    std::iota(customer_nos.begin(), customer_nos.end(), 1);
    std::shuffle(customer_nos.begin(), customer_nos.end(), gen);

    Solution sol(instance);
    for (int cust_no : customer_nos) {
        Stop stop(cust_no, instance.demand_of_customer[cust_no]);
        int best_vehicle = -1, best_index = -1;
        double best_delta = std::numeric_limits<double>::max();
        for (int v = 0; v < (int)sol.routes.size(); ++v) {
            const Route& route = sol.routes[v];
            BestInsertion ins = route.speculative_add_best(stop);
            double delta = ins.result.cost - route.cost();
            if (ins.result.feasible && delta < best_delta) {
                best_delta = delta;
                best_vehicle = v;
                best_index = ins.index;
            }
        }
        if (best_vehicle == -1) {
            throw std::runtime_error("Could not insert cust no: " + std::to_string(cust_no));
        }
        sol.routes[best_vehicle].add_stop_to_index(stop, best_index);
    }
    return sol;
}

double polar_angle(const VRPInstance& instance, int cust_no) {
    double delta_x = instance.x_coord_of_customer[0] - instance.x_coord_of_customer[cust_no];
    double delta_y = instance.y_coord_of_customer[0] - instance.y_coord_of_customer[cust_no];
    return std::atan2(delta_y, delta_x);
}

bool sweep(const VRPInstance& instance, std::mt19937& gen, Solution& out) {
    std::vector<int> customer_nos(instance.num_customers - 1);
    std::iota(customer_nos.begin(), customer_nos.end(), 1);
    std::vector<double> angle(instance.num_customers, 0.0);
    for (int c : customer_nos) angle[c] = polar_angle(instance, c);
    std::stable_sort(customer_nos.begin(), customer_nos.end(), [&](int a, int b) { return angle[a] < angle[b]; });
    if (!customer_nos.empty()) {
        std::uniform_int_distribution<> offset(0, (int)customer_nos.size() - 1);
        std::rotate(customer_nos.begin(), customer_nos.begin() + offset(gen), customer_nos.end());
    }

    Solution sol(instance);
    if (!first_fit(instance, customer_nos, sol)) return false;
    out = std::move(sol);
    return true;
}

bool clarke_wright(const VRPInstance& instance, std::mt19937& gen, Solution& out) {
    const int n = instance.num_customers;
    // A customer that overflows an empty vehicle cannot seed a route.
    for (int c = 1; c < n; ++c) {
        if (instance.demand_of_customer[c] > instance.vehicle_capacity) return false;
    }

    // Slot c-1 starts as the singleton route of customer c.
    std::vector<Route> routes;
    routes.reserve(n > 1 ? n - 1 : 0);
    std::vector<int> owner(n, -1);
    for (int c = 1; c < n; ++c) {
        routes.emplace_back(instance, c - 1);
        routes.back().add_stop_to_index(Stop(c, instance.demand_of_customer[c]), 0);
        owner[c] = c - 1;
    }
    std::vector<char> alive(routes.size(), 1);
    int alive_count = (int)routes.size();

    struct Saving { int i; int j; double value; };
    std::vector<Saving> savings;
    if (n > 2) savings.reserve((size_t)(n - 1) * (n - 2) / 2);
    std::normal_distribution<double> noise(1.0, 1.0);
    for (int i = 1; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            double s = instance.dist(i, 0) + instance.dist(0, j) - instance.dist(i, j);
            savings.push_back({i, j, s + noise(gen)});
        }
    }
    std::sort(savings.begin(), savings.end(), [](const Saving& a, const Saving& b) { return a.value > b.value; });

    // Moves every stop of `tail` onto the end of `head`.
    auto merge = [&](int head, int tail) {
        for (const Stop& s : routes[tail].stops()) {
            routes[head].add_stop_to_index(s, routes[head].size());
            owner[s.cust_no] = head;
        }
        routes[tail].retain_stops([](const Stop&) { return false; });
        alive[tail] = 0;
        --alive_count;
    };

    for (const auto& sv : savings) {
        if (alive_count <= instance.num_vehicles) break;
        int ri = owner[sv.i];
        int rj = owner[sv.j];
        if (ri == rj) continue;
        if (routes[ri].used_capacity() + routes[rj].used_capacity() > instance.vehicle_capacity) continue;
        if (routes[ri].last() == sv.i && routes[rj].first() == sv.j) {
            merge(ri, rj);
        } else if (routes[rj].last() == sv.j && routes[ri].first() == sv.i) {
            merge(rj, ri);
        }
    }
    if (alive_count > instance.num_vehicles) return false;

    Solution sol(instance);
    int slot = 0;
    for (size_t r = 0; r < routes.size(); ++r) {
        if (!alive[r]) continue;
        Route& target = sol.routes[slot++];
        for (const Stop& s : routes[r].stops()) {
            target.add_stop_to_index(s, target.size());
        }
    }
    out = std::move(sol);
    return true;
}

Solution clarke_wright_and_then_sweep(const VRPInstance& instance, std::mt19937& gen, int verbose) {
    Solution sol;
    for (int attempt = 0; attempt < kClarkeWrightAttempts; ++attempt) {
        if (clarke_wright(instance, gen, sol)) {
            if (verbose >= 2) std::cout << "[construct] clarke-wright succeeded on attempt " + std::to_string(attempt + 1) + "\n";
            return sol;
        }
    }
    for (int attempt = 0; attempt < kSweepAttempts; ++attempt) {
        if (sweep(instance, gen, sol)) {
            if (verbose >= 2) std::cout << "[construct] sweep succeeded on attempt " + std::to_string(attempt + 1) + "\n";
            return sol;
        }
    }
    if (verbose >= 2) std::cout << "[construct] falling back to greedy\n";
    return greedy(instance);
}

Solution sweep_then_clarke_wright(const VRPInstance& instance, std::mt19937& gen, int verbose) {
    Solution sol;
    for (int attempt = 0; attempt < kSweepAttempts; ++attempt) {
        if (sweep(instance, gen, sol)) {
            if (verbose >= 2) std::cout << "[construct] sweep succeeded on attempt " + std::to_string(attempt + 1) + "\n";
            return sol;
        }
    }
    for (int attempt = 0; attempt < kClarkeWrightAttempts; ++attempt) {
        if (clarke_wright(instance, gen, sol)) {
            if (verbose >= 2) std::cout << "[construct] clarke-wright succeeded on attempt " + std::to_string(attempt + 1) + "\n";
            return sol;
        }
    }
    if (verbose >= 2) std::cout << "[construct] falling back to greedy\n";
    return greedy(instance);
}

} // namespace construct
