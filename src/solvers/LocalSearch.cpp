#include "LocalSearch.h"
#include <algorithm>
#include <numeric>
#include <vector>

namespace local_search {

bool apply_first_swap(Solution& sol, std::mt19937& gen, SwapMove* applied) {
    const int capacity = sol.instance()->vehicle_capacity;
    std::vector<int> order(sol.routes.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), gen);

    for (int ai = 0; ai < (int)order.size(); ++ai) {
        for (int bi = 0; bi < ai; ++bi) {
            int a_r = order[ai], b_r = order[bi];
            const Route& a_route = sol.routes[a_r];
            const Route& b_route = sol.routes[b_r];
            double initial_cost = a_route.cost() + b_route.cost();
            for (int a_i = 0; a_i < a_route.size(); ++a_i) {
                const Stop& a = a_route.stops()[a_i];
                for (int b_i = 0; b_i < b_route.size(); ++b_i) {
                    const Stop& b = b_route.stops()[b_i];
                    if (a_route.used_capacity() - a.demand + b.demand > capacity) continue;
                    if (b_route.used_capacity() - b.demand + a.demand > capacity) continue;
                    double new_cost = a_route.cost_if_cust_no_was(b, a_i) + b_route.cost_if_cust_no_was(a, b_i);
                    if (initial_cost - new_cost <= 0.01) continue;

                    Stop a_stop = sol.routes[a_r].remove_stop_at_index(a_i);
                    Stop b_stop = sol.routes[b_r].remove_stop_at_index(b_i);
                    sol.routes[a_r].add_stop_to_index(b_stop, a_i);
                    sol.routes[b_r].add_stop_to_index(a_stop, b_i);
                    if (applied) *applied = {a_r, a_i, b_r, b_i};
                    return true;
                }
            }
        }
    }
    return false;
}

int polish_with_swaps(Solution& sol, std::mt19937& gen, int max_rounds) {
    int applied = 0;
    while (applied < max_rounds && apply_first_swap(sol, gen)) ++applied;
    return applied;
}

} // namespace local_search
