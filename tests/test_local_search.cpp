#include <gtest/gtest.h>
#include <random>
#include "construct.h"
#include "solvers/LocalSearch.h"
#include "test_helpers.h"

namespace {

// Two clusters on opposite sides of the depot, served crosswise by two routes.
VRPInstance crossed_instance() {
    return VRPInstance(2, 2, {0, 1, 1, 1, 1}, {0, 100, 101, -100, -101}, {0, 0, 0, 0, 0});
}

Solution crossed_solution(const VRPInstance& inst) {
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    sol.routes[0].add_stop_to_index(Stop(3, 1), 1);
    sol.routes[1].add_stop_to_index(Stop(2, 1), 0);
    sol.routes[1].add_stop_to_index(Stop(4, 1), 1);
    return sol;
}

} // namespace

TEST(LocalSearchTest, FirstSwapUntanglesCrossedRoutes) {
    VRPInstance inst = crossed_instance();
    Solution sol = crossed_solution(inst);
    const double before = sol.cost();
    EXPECT_NEAR(before, 804.0, 1e-9);

    std::mt19937 gen(1);
    local_search::SwapMove move{};
    ASSERT_TRUE(local_search::apply_first_swap(sol, gen, &move));
    EXPECT_NE(move.a_route, move.b_route);
    EXPECT_TRUE(sol.is_valid_solution());
    EXPECT_NEAR(sol.cost(), 404.0, 1e-9);
    EXPECT_FALSE(local_search::apply_first_swap(sol, gen));
}

TEST(LocalSearchTest, PolishStopsAtLocalOptimum) {
    VRPInstance inst = crossed_instance();
    Solution sol = crossed_solution(inst);
    std::mt19937 gen(2);
    EXPECT_EQ(local_search::polish_with_swaps(sol, gen), 1);
    EXPECT_NEAR(sol.cost(), 404.0, 1e-9);
}

TEST(LocalSearchTest, SwapsRespectCapacity) {
    // Trading customer 2 into route 0 would pay off but overloads it.
    VRPInstance inst(2, 2, {0, 1, 2, 1}, {0, 100, 101, -100}, {0, 0, 0, 0});
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    sol.routes[0].add_stop_to_index(Stop(3, 1), 1);
    sol.routes[1].add_stop_to_index(Stop(2, 2), 0);
    std::mt19937 gen(3);
    EXPECT_FALSE(local_search::apply_first_swap(sol, gen));
}

TEST(LocalSearchTest, PolishKeepsConstructedSolutionsValid) {
    VRPInstance inst = test_helpers::ring_instance();
    std::mt19937 gen(4);
    Solution sol = construct::greedy(inst);
    const double before = sol.cost();
    local_search::polish_with_swaps(sol, gen);
    EXPECT_TRUE(sol.is_valid_solution());
    EXPECT_LE(sol.cost(), before);
}
