#include <gtest/gtest.h>
#include <cmath>
#include <sstream>
#include "construct.h"
#include "core/Solution.h"
#include "core/SolutionChecker.h"
#include "test_helpers.h"

using test_helpers::ring_instance;
using test_helpers::two_customer_instance;

TEST(SolutionTest, StartsWithOneEmptyRoutePerVehicle) {
    VRPInstance inst = ring_instance(10, 3, 30);
    Solution sol(inst);
    ASSERT_EQ(sol.routes.size(), 3u);
    EXPECT_EQ(sol.num_nonempty_routes(), 0);
    EXPECT_DOUBLE_EQ(sol.cost(), 0.0);
    EXPECT_EQ(sol.instance(), &inst);
}

TEST(SolutionTest, RouteStringFramesEveryRoute) {
    VRPInstance inst = two_customer_instance(2);
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    sol.routes[0].add_stop_to_index(Stop(2, 1), 1);
    EXPECT_EQ(sol.to_string(), "0 1 2 0 0 0");
    EXPECT_EQ(sol.route_index_of(2), 0);
    EXPECT_EQ(sol.route_index_of(5), -1);
}

TEST(SolutionTest, FileFormStartsWithCostAndVehicleCount) {
    VRPInstance inst = two_customer_instance(2);
    Solution sol(inst);
    sol.routes[1].add_stop_to_index(Stop(2, 1), 0);
    sol.routes[1].add_stop_to_index(Stop(1, 1), 1);

    std::istringstream in(sol.to_file_string());
    double cost = 0.0;
    int vehicles = 0;
    in >> cost >> vehicles;
    EXPECT_NEAR(cost, 20.0 + std::sqrt(200.0), 1e-3);
    EXPECT_EQ(vehicles, 2);
    std::string line;
    std::getline(in, line);
    std::getline(in, line);
    EXPECT_EQ(line, "0 0");
    std::getline(in, line);
    EXPECT_EQ(line, "0 2 1 0");
}

TEST(SolutionTest, FileFormKeepsLargeCostsExact) {
    VRPInstance inst(1, 10, {0, 1}, {0, 61728.39}, {0, 0});
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    ASSERT_GT(sol.cost(), 100000.0);

    std::istringstream in(sol.to_file_string());
    double cost = 0.0;
    in >> cost;
    EXPECT_DOUBLE_EQ(cost, sol.cost());
}

TEST(SolutionTest, ValidityReportsCoverageAndCapacity) {
    VRPInstance inst = two_customer_instance(2, 1);
    Solution sol(inst);
    std::string reason;

    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    EXPECT_FALSE(sol.is_valid_solution(&reason));
    EXPECT_NE(reason.find("customer 2"), std::string::npos);

    sol.routes[0].add_stop_to_index(Stop(2, 1), 1);
    EXPECT_FALSE(sol.is_valid_solution(&reason));
    EXPECT_NE(reason.find("capacity"), std::string::npos);

    sol.routes[0].remove_stop_at_index(1);
    sol.routes[1].add_stop_to_index(Stop(2, 1), 0);
    EXPECT_TRUE(sol.is_valid_solution(&reason));

    sol.routes[1].add_stop_to_index(Stop(1, 1), 0);
    EXPECT_FALSE(sol.is_valid_solution());
}

TEST(SolutionTest, DefaultSolutionIsNotValid) {
    Solution sol;
    std::string reason;
    EXPECT_FALSE(sol.is_valid_solution(&reason));
    EXPECT_FALSE(reason.empty());
}

TEST(SolutionCheckerTest, RouteStringRoundTripKeepsRoutesAndCost) {
    VRPInstance inst = ring_instance();
    Solution sol = construct::greedy(inst);

    auto routes = SolutionChecker::parse_routes(sol.to_string());
    ASSERT_EQ((int)routes.size(), sol.num_nonempty_routes());
    size_t next = 0;
    for (const auto& route : sol.routes) {
        if (route.empty()) continue;
        const auto& parsed = routes[next++];
        ASSERT_EQ((int)parsed.size(), route.size());
        for (int i = 0; i < route.size(); ++i) EXPECT_EQ(parsed[i], route.stops()[i].cust_no);
    }

    CheckResult res = SolutionChecker::check(inst, routes, sol.cost());
    EXPECT_TRUE(res.ok) << res.message;
    EXPECT_NEAR(res.recomputed_cost, sol.cost(), 1e-6);

    Solution rebuilt = SolutionChecker::to_solution(inst, routes);
    EXPECT_TRUE(rebuilt.is_valid_solution());
    EXPECT_NEAR(rebuilt.cost(), sol.cost(), 1e-6);
}

TEST(SolutionCheckerTest, FlagsWrongClaimsAndCoverage) {
    VRPInstance inst = two_customer_instance(1);
    EXPECT_FALSE(SolutionChecker::check(inst, {{1, 2}}, 10.0).ok);
    EXPECT_TRUE(SolutionChecker::check(inst, {{1, 2}}, 34.1).ok);

    CheckResult missing = SolutionChecker::check(inst, {{1}});
    EXPECT_FALSE(missing.ok);
    EXPECT_NE(missing.message.find("customer 2"), std::string::npos);

    EXPECT_FALSE(SolutionChecker::check(inst, {{1, 1, 2}}).ok);
    EXPECT_FALSE(SolutionChecker::check(inst, {{1}, {2}}).ok); // only one vehicle
    EXPECT_FALSE(SolutionChecker::check(inst, {{1, 2, 3}}).ok);

    VRPInstance tight = two_customer_instance(1, 1);
    EXPECT_FALSE(SolutionChecker::check(tight, {{1, 2}}).ok);
}

TEST(SolutionCheckerTest, ParseRoutesSplitsOnDepotAndRejectsGarbage) {
    auto routes = SolutionChecker::parse_routes("0 1 2 0 0 0 0 3 0");
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0], (std::vector<int>{1, 2}));
    EXPECT_EQ(routes[1], (std::vector<int>{3}));
    EXPECT_THROW(SolutionChecker::parse_routes("0 1 x 0"), std::runtime_error);
    EXPECT_THROW(SolutionChecker::parse_routes("0 1.5 0"), std::runtime_error);
}
