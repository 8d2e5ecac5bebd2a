#include "SolveParams.h"
#include <stdexcept>
#include <string>

SolveParams load_solve_params(const YAML::Node& params_node) {
    SolveParams params;
    if (!params_node) return params;
    if (params_node["max_iters"]) params.terminate = TermCond::iterations(params_node["max_iters"].as<long long>());
    if (params_node["time_limit"]) {
        double seconds = params_node["time_limit"].as<double>();
        if (seconds > 0.0) params.terminate = TermCond::wall_clock(seconds);
    }
    if (params_node["frac_dropped"]) params.frac_dropped = params_node["frac_dropped"].as<double>();
    if (params_node["patience"]) params.patience = params_node["patience"].as<int>();
    if (params_node["constructor"]) params.constructor = construct::constructor_from_name(params_node["constructor"].as<std::string>());
    if (params_node["jumper"]) params.jumper = jump::jump_from_name(params_node["jumper"].as<std::string>());
    if (params_node["destroy_size"]) params.destroy_size = params_node["destroy_size"].as<int>();
    if (params_node["insertion_noise"]) params.insertion_noise = params_node["insertion_noise"].as<double>();
    if (params_node["shaw_alpha"]) params.shaw_alpha = params_node["shaw_alpha"].as<double>();
    if (params_node["shaw_beta"]) params.shaw_beta = params_node["shaw_beta"].as<double>();
    if (params_node["regret_k"]) params.regret_k = params_node["regret_k"].as<int>();
    if (params_node["reward_best"]) params.reward_best = params_node["reward_best"].as<double>();
    if (params_node["reward_improve"]) params.reward_improve = params_node["reward_improve"].as<double>();
    if (params_node["reward_other"]) params.reward_other = params_node["reward_other"].as<double>();
    if (params_node["weight_interval"]) params.weight_interval = params_node["weight_interval"].as<int>();
    if (params_node["reaction_factor"]) params.reaction_factor = params_node["reaction_factor"].as<double>();
    if (params_node["min_weight"]) params.min_weight = params_node["min_weight"].as<double>();
    if (params_node["accept_worse_prob"]) params.accept_worse_prob = params_node["accept_worse_prob"].as<double>();
    if (params_node["jump_from_recent_prob"]) params.jump_from_recent_prob = params_node["jump_from_recent_prob"].as<double>();
    if (params_node["improvement_eps"]) params.improvement_eps = params_node["improvement_eps"].as<double>();
    if (params_node["polish_with_swaps"]) params.polish_with_swaps = params_node["polish_with_swaps"].as<bool>();
    if (params_node["seed"]) params.seed = params_node["seed"].as<unsigned int>();
    if (params_node["history_interval"]) params.history_interval = params_node["history_interval"].as<int>();

    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };
    if (!in_unit(params.frac_dropped)) throw std::invalid_argument("frac_dropped must be in [0, 1]");
    if (!in_unit(params.insertion_noise)) throw std::invalid_argument("insertion_noise must be in [0, 1]");
    if (!in_unit(params.accept_worse_prob)) throw std::invalid_argument("accept_worse_prob must be in [0, 1]");
    if (!in_unit(params.jump_from_recent_prob)) throw std::invalid_argument("jump_from_recent_prob must be in [0, 1]");
    if (!in_unit(params.reaction_factor)) throw std::invalid_argument("reaction_factor must be in [0, 1]");
    if (params.terminate.kind == TermCond::Kind::MaxIters && params.terminate.max_iters < 0) throw std::invalid_argument("max_iters must be non-negative");
    if (params.history_interval < 0) throw std::invalid_argument("history_interval must be non-negative");
    if (params.patience < 0) throw std::invalid_argument("patience must be non-negative");
    if (params.destroy_size < 1) throw std::invalid_argument("destroy_size must be at least 1");
    if (params.regret_k < 2) throw std::invalid_argument("regret_k must be at least 2");
    if (params.weight_interval < 1) throw std::invalid_argument("weight_interval must be at least 1");
    if (params.min_weight <= 0.0) throw std::invalid_argument("min_weight must be positive");
    return params;
}
