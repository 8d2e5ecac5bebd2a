#pragma once
#include <string>
#include <vector>
#include "Stop.h"
#include "VRPInstance.h"

// Result of a read-only projection: route cost after the move, and whether
// the route would still respect the vehicle capacity.
struct SpeculativeResult {
    double cost;
    bool feasible;
};

struct BestInsertion {
    SpeculativeResult result;
    int index;
};

// One vehicle's visit sequence. The depot is implicit at both ends.
// cost() and used_capacity() are maintained incrementally by every mutation.
class Route {
public:
    Route(const VRPInstance& instance, int id);

    int id() const { return id_; }
    const std::vector<Stop>& stops() const { return stops_; }
    int size() const { return (int)stops_.size(); }
    bool empty() const { return stops_.empty(); }
    double cost() const { return cost_; }
    int used_capacity() const { return used_cap_; }
    int remaining_capacity() const { return instance_->vehicle_capacity - used_cap_; }

    // Precondition: !empty().
    int first() const { return stops_.front().cust_no; }
    int last() const { return stops_.back().cust_no; }

    bool contains_stop(int cust_no) const;
    int index_of_stop(int cust_no) const; // -1 when absent

    // Commits without a capacity check; callers confirm feasibility first.
    void add_stop_to_index(const Stop& stop, int index);
    Stop remove_stop_at_index(int index);

    SpeculativeResult speculative_add_stop(const Stop& stop, int index) const;
    SpeculativeResult speculative_remove_stop(int index) const;
    SpeculativeResult speculative_replace_stop(const Stop& stop, int index) const;
    BestInsertion speculative_add_best(const Stop& stop) const;
    double cost_if_cust_no_was(const Stop& new_stop, int index) const;

    // Distance of the edge arriving at position index (index == size() is the edge home).
    double cost_at_index(int index) const;

    // Keeps the stops satisfying pred, then recomputes cost and capacity.
    template <class Pred>
    void retain_stops(Pred pred) {
        assert_sanity();
        std::vector<Stop> kept;
        kept.reserve(stops_.capacity());
        for (const Stop& s : stops_) {
            if (pred(s)) kept.push_back(s);
        }
        stops_.swap(kept);
        cost_ = recalculate_cost();
        used_cap_ = recalculate_capacity();
        assert_sanity();
    }

    double recalculate_cost() const;
    int recalculate_capacity() const;
    bool has_duplicate_stops() const;
    // Cached cost within 0.5 of a full recomputation, exact capacity, no duplicates.
    bool is_consistent() const;
    // Throws std::logic_error on an inconsistent route; compiled out with NDEBUG.
    void assert_sanity() const;

    std::string to_string() const;

private:
    int before_cust(int index) const { return index != 0 ? stops_[index - 1].cust_no : 0; }
    int after_cust(int index) const { return index < (int)stops_.size() ? stops_[index].cust_no : 0; }

    const VRPInstance* instance_;
    int id_;
    std::vector<Stop> stops_;
    double cost_;
    int used_cap_;
};
