#pragma once
#include <random>
#include <vector>

struct Operator {
    int id;
    double score = 0.0;   // reward accumulated since the last weight update
    double weight = 1.0;
    int usage_count = 0;

    explicit Operator(int id_) : id(id_) {}

    void update_score(double delta) {
        score += delta;
        ++usage_count;
    }

    // weight <- (1 - lambda) * weight + lambda * score, floored at min_weight; score resets.
    void update_weight(double learning_rate, double min_weight);
};

// Roulette-wheel choice over a small fixed set of operator arms.
class OperatorSelector {
public:
    OperatorSelector(int num_operators, double learning_rate, double min_weight);

    int select(std::mt19937& gen);
    int last_used() const { return last_used_; }

    // Credits the most recently selected operator.
    void reward(double delta);
    void update_weights();

    double probability(int op) const;
    const std::vector<Operator>& operators() const { return ops_; }

private:
    std::vector<Operator> ops_;
    double learning_rate_;
    double min_weight_;
    int last_used_ = 0;
};
