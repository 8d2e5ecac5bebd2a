#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "construct.h"
#include "test_helpers.h"

using test_helpers::ring_instance;
using test_helpers::two_customer_instance;

TEST(ConstructTest, GreedyPutsBothCustomersOnOneRoute) {
    VRPInstance inst = two_customer_instance();
    Solution sol = construct::greedy(inst);
    EXPECT_TRUE(sol.is_valid_solution());
    EXPECT_EQ(sol.num_nonempty_routes(), 1);
    EXPECT_NEAR(sol.cost(), 10.0 + 10.0 + std::sqrt(200.0), 1e-9);
}

TEST(ConstructTest, GreedyThrowsWhenCapacityIsInsufficient) {
    VRPInstance inst(1, 10, {0, 5, 5, 5}, {0, 1, 2, 3}, {0, 0, 0, 0});
    EXPECT_THROW(construct::greedy(inst), std::runtime_error);
}

TEST(ConstructTest, ClarkeWrightMergesThreeSingletonsForOneVehicle) {
    VRPInstance inst(1, 10, {0, 1, 1, 1}, {0, 10, 0, -10}, {0, 0, 10, 0});
    std::mt19937 gen(3);
    for (int trial = 0; trial < 20; ++trial) {
        Solution sol;
        ASSERT_TRUE(construct::clarke_wright(inst, gen, sol));
        EXPECT_TRUE(sol.is_valid_solution());
        EXPECT_EQ(sol.num_nonempty_routes(), 1);
        EXPECT_EQ(sol.routes[0].size(), 3);
    }
    Solution cascade = construct::clarke_wright_and_then_sweep(inst, gen);
    EXPECT_TRUE(cascade.is_valid_solution());
    EXPECT_EQ(cascade.num_nonempty_routes(), 1);
}

TEST(ConstructTest, ClarkeWrightFailsWhenTooManyRoutesRemain) {
    VRPInstance inst(1, 10, {0, 6, 6}, {0, 10, -10}, {0, 0, 0});
    std::mt19937 gen(3);
    Solution sol;
    EXPECT_FALSE(construct::clarke_wright(inst, gen, sol));
    EXPECT_FALSE(construct::sweep(inst, gen, sol));
    EXPECT_THROW(construct::clarke_wright_and_then_sweep(inst, gen), std::runtime_error);
    EXPECT_THROW(construct::sweep_then_clarke_wright(inst, gen), std::runtime_error);
}

TEST(ConstructTest, ClarkeWrightRejectsCustomerAboveCapacity) {
    VRPInstance inst(2, 10, {0, 12, 1, 1}, {0, 1, 2, 3}, {0, 0, 0, 0});
    std::mt19937 gen(1);
    Solution sol;
    EXPECT_FALSE(construct::clarke_wright(inst, gen, sol));
    EXPECT_THROW(construct::greedy(inst), std::runtime_error);
    EXPECT_THROW(construct::clarke_wright_and_then_sweep(inst, gen), std::runtime_error);
    EXPECT_THROW(construct::sweep_then_clarke_wright(inst, gen), std::runtime_error);
}

TEST(ConstructTest, EveryConstructorYieldsAValidSolution) {
    VRPInstance inst = ring_instance();
    for (unsigned int seed = 1; seed <= 5; ++seed) {
        std::mt19937 gen(seed);
        for (auto kind : {construct::ConstructorKind::ClarkeWrightThenSweep,
                          construct::ConstructorKind::SweepThenClarkeWright,
                          construct::ConstructorKind::Greedy,
                          construct::ConstructorKind::CheapestInsertion}) {
            Solution sol = construct::build(kind, inst, gen);
            std::string reason;
            EXPECT_TRUE(sol.is_valid_solution(&reason)) << construct::constructor_name(kind) << ": " << reason;
            EXPECT_LE(sol.num_nonempty_routes(), inst.num_vehicles);
        }
    }
}

TEST(ConstructTest, SweepVisitsCustomersInAngularOrder) {
    VRPInstance inst = ring_instance(12, 12, 5);
    std::mt19937 gen(9);
    Solution sol;
    ASSERT_TRUE(construct::sweep(inst, gen, sol));
    EXPECT_TRUE(sol.is_valid_solution());
    // Consecutive stops on a route are consecutive in the rotated angular order.
    std::vector<int> order;
    for (const auto& route : sol.routes) {
        for (const auto& s : route.stops()) order.push_back(s.cust_no);
    }
    ASSERT_EQ((int)order.size(), 12);
    int wraps = 0;
    for (size_t i = 1; i < order.size(); ++i) {
        if (construct::polar_angle(inst, order[i]) < construct::polar_angle(inst, order[i - 1])) ++wraps;
    }
    EXPECT_LE(wraps, 1);
}

TEST(ConstructTest, PolarAngleIsMeasuredFromCustomerToDepot) {
    VRPInstance inst(1, 10, {0, 1, 1}, {0, 1, 0}, {0, 0, 1});
    EXPECT_NEAR(construct::polar_angle(inst, 1), std::acos(-1.0), 1e-12);
    EXPECT_NEAR(construct::polar_angle(inst, 2), -std::acos(-1.0) / 2.0, 1e-12);
}

TEST(ConstructTest, NamesRoundTrip) {
    using construct::ConstructorKind;
    for (auto kind : {ConstructorKind::ClarkeWrightThenSweep, ConstructorKind::SweepThenClarkeWright,
                      ConstructorKind::Greedy, ConstructorKind::CheapestInsertion}) {
        EXPECT_EQ(construct::constructor_from_name(construct::constructor_name(kind)), kind);
    }
    EXPECT_EQ(construct::constructor_from_name("clarke_wright_and_then_sweep"), ConstructorKind::ClarkeWrightThenSweep);
    EXPECT_THROW(construct::constructor_from_name("savings"), std::invalid_argument);
}
