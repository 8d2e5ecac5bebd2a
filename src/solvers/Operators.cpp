#include "Operators.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <tuple>

namespace operators {

bool extract_customer(Solution& sol, int cust_no, RemovedStops& out) {
    for (int r = 0; r < (int)sol.routes.size(); ++r) {
        int index = sol.routes[r].index_of_stop(cust_no);
        if (index != -1) {
            out.emplace_back(sol.routes[r].remove_stop_at_index(index), r);
            return true;
        }
    }
    return false;
}

RemovedStops remove_random(Solution& sol, TabuPool& pool, int n, std::mt19937& gen) {
    n = std::min(n, pool.eligible_count());
    RemovedStops res;
    res.reserve(n);
    for (int k = 0; k < n; ++k) {
        int cust_no = pool.take_random(gen);
        extract_customer(sol, cust_no, res);
    }
    return res;
}

RemovedStops remove_shaw(Solution& sol, TabuPool& pool, const VRPInstance& instance, int n,
                         double alpha, double beta, std::mt19937& gen) {
    RemovedStops res;
    n = std::min(n, pool.eligible_count());
    if (n <= 0) return res;

    const std::vector<int>& eligible = pool.eligible();
    std::uniform_int_distribution<> pick(0, (int)eligible.size() - 1);
    int seed_cust_no = eligible[pick(gen)];
    double seed_demand = instance.demand_of_customer[seed_cust_no];

    std::vector<std::pair<double, int>> similarity; // (score, cust_no)
    similarity.reserve(eligible.size());
    for (int cust_no : eligible) {
        if (cust_no == seed_cust_no) continue;
        double dist = instance.dist(seed_cust_no, cust_no);
        double demand_diff = std::abs(seed_demand - instance.demand_of_customer[cust_no]);
        similarity.emplace_back(alpha * dist + beta * demand_diff, cust_no);
    }
    int others = std::min(n - 1, (int)similarity.size());
    std::partial_sort(similarity.begin(), similarity.begin() + others, similarity.end());

    std::vector<int> customer_nos;
    customer_nos.reserve(n);
    customer_nos.push_back(seed_cust_no);
    for (int k = 0; k < others; ++k) customer_nos.push_back(similarity[k].second);

    res.reserve(customer_nos.size());
    for (int cust_no : customer_nos) {
        pool.take(cust_no);
        extract_customer(sol, cust_no, res);
    }
    return res;
}

int reinsert_in_best_spot(Solution& sol, const Stop& stop, double noise_prob, std::mt19937& gen) {
    std::bernoulli_distribution explore(noise_prob);
    bool random_spot = explore(gen);

    int best_r = -1, best_i = -1;
    double best_increase = std::numeric_limits<double>::max();
    std::vector<std::pair<int, int>> valid;

    for (int r = 0; r < (int)sol.routes.size(); ++r) {
        const Route& route = sol.routes[r];
        if (stop.demand > route.remaining_capacity()) continue;
        for (int i = 0; i <= route.size(); ++i) {
            SpeculativeResult spec = route.speculative_add_stop(stop, i);
            if (!spec.feasible) continue;
            if (random_spot) valid.emplace_back(r, i);
            double increase = spec.cost - route.cost();
            if (increase < best_increase) {
                best_increase = increase;
                best_r = r;
                best_i = i;
            }
        }
    }
    if (best_r == -1) return -1;

    if (random_spot) {
        std::uniform_int_distribution<> pick(0, (int)valid.size() - 1);
        std::tie(best_r, best_i) = valid[pick(gen)];
    }
    sol.routes[best_r].add_stop_to_index(stop, best_i);
    return best_r;
}

bool reinsert_best(Solution& sol, const RemovedStops& removed, double noise_prob, std::mt19937& gen,
                   std::vector<int>* routes_used) {
    RemovedStops order = removed;
    std::stable_sort(order.begin(), order.end(), [](const std::pair<Stop, int>& a, const std::pair<Stop, int>& b) {
        return a.first.demand > b.first.demand;
    });
    for (const auto& entry : order) {
        int r = reinsert_in_best_spot(sol, entry.first, noise_prob, gen);
        if (r == -1) return false;
        if (routes_used) routes_used->push_back(r);
    }
    return true;
}

double regret_k(const Solution& sol, const Stop& stop, int k) {
    // Max-heap holding the k cheapest increases seen so far.
    std::priority_queue<double> cheapest;
    double best = std::numeric_limits<double>::infinity();
    for (const Route& route : sol.routes) {
        for (int i = 0; i <= route.size(); ++i) {
            SpeculativeResult spec = route.speculative_add_stop(stop, i);
            if (!spec.feasible) continue;
            double increase = spec.cost - route.cost();
            best = std::min(best, increase);
            cheapest.push(increase);
            if ((int)cheapest.size() > k) cheapest.pop();
        }
    }
    if ((int)cheapest.size() < k) return std::numeric_limits<double>::infinity();
    return cheapest.top() - best;
}

bool reinsert_regret(Solution& sol, const RemovedStops& removed, int k, double noise_prob, std::mt19937& gen,
                     std::vector<int>* routes_used) {
    std::vector<std::pair<double, size_t>> regrets; // (regret, position in removed)
    regrets.reserve(removed.size());
    for (size_t idx = 0; idx < removed.size(); ++idx) {
        regrets.emplace_back(regret_k(sol, removed[idx].first, k), idx);
    }
    std::stable_sort(regrets.begin(), regrets.end(), [](const std::pair<double, size_t>& a, const std::pair<double, size_t>& b) {
        return a.first > b.first;
    });
    for (const auto& entry : regrets) {
        int r = reinsert_in_best_spot(sol, removed[entry.second].first, noise_prob, gen);
        if (r == -1) return false;
        if (routes_used) routes_used->push_back(r);
    }
    return true;
}

} // namespace operators
