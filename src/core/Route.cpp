#include "Route.h"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

Route::Route(const VRPInstance& instance, int id)
    : instance_(&instance), id_(id), cost_(0.0), used_cap_(0) {
    stops_.reserve(instance.max_route_len + 1);
}

bool Route::contains_stop(int cust_no) const {
    return index_of_stop(cust_no) != -1;
}

int Route::index_of_stop(int cust_no) const {
    for (int i = 0; i < (int)stops_.size(); ++i) {
        if (stops_[i].cust_no == cust_no) return i;
    }
    return -1;
}

void Route::add_stop_to_index(const Stop& stop, int index) {
    assert_sanity();
    if (index < 0 || index > (int)stops_.size()) {
        throw std::out_of_range("insert index " + std::to_string(index) + " outside route " + std::to_string(id_));
    }
    SpeculativeResult projected = speculative_add_stop(stop, index);
    stops_.insert(stops_.begin() + index, stop);
    used_cap_ += stop.demand;
    cost_ = projected.cost;
    assert_sanity();
}

Stop Route::remove_stop_at_index(int index) {
    assert_sanity();
    if (index < 0 || index >= (int)stops_.size()) {
        throw std::out_of_range("remove index " + std::to_string(index) + " outside route " + std::to_string(id_));
    }
    SpeculativeResult projected = speculative_remove_stop(index);
    Stop stop = stops_[index];
    stops_.erase(stops_.begin() + index);
    used_cap_ -= stop.demand;
    cost_ = stops_.empty() ? 0.0 : projected.cost;
    assert_sanity();
    return stop;
}

SpeculativeResult Route::speculative_add_stop(const Stop& stop, int index) const {
    int before = before_cust(index);
    int after = after_cust(index);
    double new_cost = cost_;
    new_cost -= instance_->dist(before, after);
    new_cost += instance_->dist(before, stop.cust_no);
    new_cost += instance_->dist(stop.cust_no, after);
    return {new_cost, used_cap_ + stop.demand <= instance_->vehicle_capacity};
}

SpeculativeResult Route::speculative_remove_stop(int index) const {
    const Stop& stop = stops_.at(index);
    int before = before_cust(index);
    int after = after_cust(index + 1);
    double new_cost = cost_;
    new_cost -= instance_->dist(before, stop.cust_no);
    new_cost -= instance_->dist(stop.cust_no, after);
    new_cost += instance_->dist(before, after);
    return {new_cost, used_cap_ - stop.demand <= instance_->vehicle_capacity};
}

SpeculativeResult Route::speculative_replace_stop(const Stop& stop, int index) const {
    const Stop& old_stop = stops_.at(index);
    return {cost_if_cust_no_was(stop, index),
            used_cap_ - old_stop.demand + stop.demand <= instance_->vehicle_capacity};
}

BestInsertion Route::speculative_add_best(const Stop& stop) const {
    if (stops_.empty()) {
        return {speculative_add_stop(stop, 0), 0};
    }
    BestInsertion best{{std::numeric_limits<double>::max(), false}, 0};
    for (int i = 0; i <= (int)stops_.size(); ++i) {
        SpeculativeResult r = speculative_add_stop(stop, i);
        if (r.cost < best.result.cost) {
            best.result = r;
            best.index = i;
        }
    }
    return best;
}

double Route::cost_if_cust_no_was(const Stop& new_stop, int index) const {
    const Stop& old_stop = stops_.at(index);
    int before = before_cust(index);
    int after = after_cust(index + 1);
    double new_cost = cost_;
    new_cost -= instance_->dist(before, old_stop.cust_no);
    new_cost -= instance_->dist(old_stop.cust_no, after);
    new_cost += instance_->dist(before, new_stop.cust_no);
    new_cost += instance_->dist(new_stop.cust_no, after);
    return new_cost;
}

double Route::cost_at_index(int index) const {
    if (index < 0 || index > (int)stops_.size()) {
        throw std::out_of_range("edge index " + std::to_string(index) + " outside route " + std::to_string(id_));
    }
    return instance_->dist(before_cust(index), after_cust(index));
}

double Route::recalculate_cost() const {
    if (stops_.empty()) return 0.0;
    double cost = instance_->dist(0, stops_.front().cust_no);
    for (size_t i = 1; i < stops_.size(); ++i) {
        cost += instance_->dist(stops_[i - 1].cust_no, stops_[i].cust_no);
    }
    cost += instance_->dist(stops_.back().cust_no, 0);
    return cost;
}

int Route::recalculate_capacity() const {
    int cap = 0;
    for (const Stop& s : stops_) cap += s.demand;
    return cap;
}

bool Route::has_duplicate_stops() const {
    std::unordered_set<Stop> existing;
    for (const Stop& s : stops_) {
        if (!existing.insert(s).second) return true;
    }
    return false;
}

bool Route::is_consistent() const {
    return std::abs(recalculate_cost() - cost_) < 0.5 &&
           recalculate_capacity() == used_cap_ &&
           !has_duplicate_stops();
}

void Route::assert_sanity() const {
#ifndef NDEBUG
    if (!is_consistent()) {
        throw std::logic_error("route invariant violated: " + to_string() +
                               " cached cost " + std::to_string(cost_) +
                               " recomputed " + std::to_string(recalculate_cost()));
    }
#endif
}

std::string Route::to_string() const {
    std::ostringstream oss;
    oss << "r" << id_ << "[";
    for (size_t i = 0; i < stops_.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << stops_[i].cust_no << "(" << stops_[i].demand << ")";
    }
    oss << "--c" << used_cap_ << "]";
    return oss.str();
}
