#pragma once
#include <vector>

// Immutable CVRP instance. Index 0 is the depot; customers are 1..num_customers-1.
class VRPInstance {
public:
    int num_customers;     // including the depot
    int num_vehicles;
    int vehicle_capacity;
    std::vector<int> demand_of_customer;
    std::vector<double> x_coord_of_customer;
    std::vector<double> y_coord_of_customer;
    std::vector<std::vector<double>> distance_matrix; // [node][node] Euclidean distances
    int max_route_len;     // preallocation hint for route stop vectors

    VRPInstance(int num_vehicles_, int vehicle_capacity_,
                std::vector<int> demands, std::vector<double> xs, std::vector<double> ys);

    double dist(int a, int b) const { return distance_matrix.at(a).at(b); }

    // Number of smallest-demand customers that fit before the capacity is exhausted.
    static int compute_max_route_len(const std::vector<int>& demands, int capacity);

private:
    void build_distance_matrix();
};
