#pragma once
#include <random>
#include "../core/Solution.h"

namespace local_search {

struct SwapMove {
    int a_route;
    int a_index;
    int b_route;
    int b_index;
};

// Finds the first capacity-feasible exchange of two customers between two
// routes that lowers their joint cost by more than 0.01 and applies it.
// Routes are scanned in a random order. Returns false when no such swap exists.
bool apply_first_swap(Solution& sol, std::mt19937& gen, SwapMove* applied = nullptr);

// Applies improving swaps until none is left or max_rounds is reached.
int polish_with_swaps(Solution& sol, std::mt19937& gen, int max_rounds = 100);

} // namespace local_search
