#pragma once
#include <map>
#include <ostream>
#include <utility>
#include <vector>
#include "Operators.h"

struct SolveStats {
    long long iterations = 0;
    std::vector<std::pair<long long, double>> improvements; // (iteration, new best cost)
    std::vector<long long> restarts;
    std::map<int, int> cust_change_freq;
    std::map<int, int> route_remove_freq;
    std::map<int, int> route_add_freq;

    void update_on_iter(long long iter, double new_cost, double improvement_on_best) {
        if (improvement_on_best > 0.01) improvements.emplace_back(iter, new_cost);
        ++iterations;
    }

    void on_restart(long long iter) { restarts.push_back(iter); }

    void record_removed(const RemovedStops& removed) {
        for (const auto& entry : removed) {
            ++cust_change_freq[entry.first.cust_no];
            ++route_remove_freq[entry.second];
        }
    }

    void record_added(const std::vector<int>& route_idxs) {
        for (int r : route_idxs) ++route_add_freq[r];
    }

    void print(std::ostream& os) const {
        os << "  iterations: " << iterations << "\n"
           << "  improvements: " << improvements.size() << "\n"
           << "  restarts: " << restarts.size() << "\n";
        int busiest = -1, busiest_count = 0;
        for (const auto& kv : cust_change_freq) {
            if (kv.second > busiest_count) {
                busiest = kv.first;
                busiest_count = kv.second;
            }
        }
        if (busiest != -1) os << "  most moved customer: " << busiest << " (" << busiest_count << " times)\n";
    }
};
