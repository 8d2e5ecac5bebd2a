#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <string>
#include "VRPInstance.h"

VRPInstance::VRPInstance(int num_vehicles_, int vehicle_capacity_,
                         std::vector<int> demands, std::vector<double> xs, std::vector<double> ys)
    : num_customers((int)demands.size()), num_vehicles(num_vehicles_), vehicle_capacity(vehicle_capacity_),
      demand_of_customer(std::move(demands)), x_coord_of_customer(std::move(xs)), y_coord_of_customer(std::move(ys)),
      max_route_len(0) {
    if (num_customers < 1) {
        throw std::invalid_argument("instance needs at least the depot");
    }
    if ((int)x_coord_of_customer.size() != num_customers || (int)y_coord_of_customer.size() != num_customers) {
        throw std::invalid_argument("coordinate arrays must have " + std::to_string(num_customers) + " entries");
    }
    if (num_vehicles <= 0 || vehicle_capacity <= 0) {
        throw std::invalid_argument("vehicle count and capacity must be positive");
    }
    build_distance_matrix();
    max_route_len = compute_max_route_len(demand_of_customer, vehicle_capacity);
}

// Helper: compute Euclidean distance between two nodes
static double euclidean(double ax, double ay, double bx, double by) {
    double dx = ax - bx;
    double dy = ay - by;
    return std::sqrt(dx * dx + dy * dy);
}

void VRPInstance::build_distance_matrix() {
    distance_matrix.assign(num_customers, std::vector<double>(num_customers, 0.0));
    for (int i = 0; i < num_customers; ++i) {
        for (int j = i + 1; j < num_customers; ++j) {
            double d = euclidean(x_coord_of_customer[i], y_coord_of_customer[i],
                                 x_coord_of_customer[j], y_coord_of_customer[j]);
            distance_matrix[i][j] = d;
            distance_matrix[j][i] = d;
        }
    }
}

int VRPInstance::compute_max_route_len(const std::vector<int>& demands, int capacity) {
    if (demands.size() <= 1) return 0;
    std::vector<int> sorted(demands.begin() + 1, demands.end()); // skip depot
    std::sort(sorted.begin(), sorted.end());
    int used_cap = 0;
    int count = 0;
    for (int d : sorted) {
        if (used_cap >= capacity) break;
        ++count;
        used_cap += d;
    }
    return count;
}
