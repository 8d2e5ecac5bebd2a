#pragma once
#include <chrono>
#include <memory>
#include <yaml-cpp/yaml.h>
#include "../construct.h"
#include "../jump.h"
#include "../core/Solution.h"

// Iteration budget or wall-clock budget, checked at the top of each iteration.
struct TermCond {
    enum class Kind { MaxIters, TimeElapsed };
    Kind kind = Kind::MaxIters;
    long long max_iters = 0;
    std::chrono::duration<double> time_limit{0.0};

    static TermCond iterations(long long n) {
        TermCond t;
        t.kind = Kind::MaxIters;
        t.max_iters = n;
        return t;
    }
    static TermCond wall_clock(double seconds) {
        TermCond t;
        t.kind = Kind::TimeElapsed;
        t.time_limit = std::chrono::duration<double>(seconds);
        return t;
    }
};

struct SolveParams {
    TermCond terminate = TermCond::iterations(10000);
    double frac_dropped = 0.0;          // share of customers dropped by a jump
    int patience = 10;                  // stagnant iterations before a jump
    construct::ConstructorKind constructor = construct::ConstructorKind::ClarkeWrightThenSweep;
    jump::JumpKind jumper = jump::JumpKind::RandomJump;
    std::shared_ptr<const Solution> initial_solution; // skips construction when set

    // Destroy / repair
    int destroy_size = 5;
    double insertion_noise = 0.02;      // chance of a random feasible slot instead of the best
    double shaw_alpha = 0.5;
    double shaw_beta = 0.5;
    int regret_k = 2;

    // Adaptive operator weights
    double reward_best = 10.0;
    double reward_improve = 5.0;
    double reward_other = 1.0;
    int weight_interval = 1000;
    double reaction_factor = 0.01;
    double min_weight = 1e-3;

    // Acceptance and restarts
    double accept_worse_prob = 0.1;
    double jump_from_recent_prob = 0.2;
    double improvement_eps = 0.1;
    bool polish_with_swaps = false;

    unsigned int seed = 0;              // 0 draws from std::random_device
    int history_interval = 0;           // record best cost every N iterations when > 0
};

// Reads the `params:` node of a parameter file; absent keys keep their defaults.
// Throws std::invalid_argument for unknown strategy names or out-of-range values.
SolveParams load_solve_params(const YAML::Node& params_node);
