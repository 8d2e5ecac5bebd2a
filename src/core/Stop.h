#pragma once
#include <cstddef>
#include <functional>

// A customer placed on a route. Identity is the customer number only.
struct Stop {
    int cust_no = 0;
    int demand = 0;

    Stop() = default;
    Stop(int cust_no_, int demand_) : cust_no(cust_no_), demand(demand_) {}

    bool operator==(const Stop& other) const { return cust_no == other.cust_no; }
    bool operator!=(const Stop& other) const { return cust_no != other.cust_no; }
};

namespace std {
template <>
struct hash<Stop> {
    size_t operator()(const Stop& s) const noexcept { return std::hash<int>()(s.cust_no); }
};
} // namespace std
