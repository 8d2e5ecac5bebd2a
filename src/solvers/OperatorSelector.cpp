#include "OperatorSelector.h"
#include <algorithm>
#include <stdexcept>

void Operator::update_weight(double learning_rate, double min_weight) {
    weight = std::max(min_weight, (1.0 - learning_rate) * weight + learning_rate * score);
    score = 0.0;
}

OperatorSelector::OperatorSelector(int num_operators, double learning_rate, double min_weight)
    : learning_rate_(learning_rate), min_weight_(min_weight) {
    if (num_operators < 1) throw std::invalid_argument("selector needs at least one operator");
    for (int i = 0; i < num_operators; ++i) ops_.emplace_back(i);
}

int OperatorSelector::select(std::mt19937& gen) {
    double total = 0.0;
    for (const auto& op : ops_) total += op.weight;
    std::uniform_real_distribution<> ru(0.0, total);
    double r = ru(gen);
    double acc = 0.0;
    last_used_ = (int)ops_.size() - 1;
    for (size_t i = 0; i < ops_.size(); ++i) {
        acc += ops_[i].weight;
        if (r < acc) {
            last_used_ = (int)i;
            break;
        }
    }
    return last_used_;
}

void OperatorSelector::reward(double delta) {
    ops_[last_used_].update_score(delta);
}

void OperatorSelector::update_weights() {
    for (auto& op : ops_) op.update_weight(learning_rate_, min_weight_);
}

double OperatorSelector::probability(int op) const {
    double total = 0.0;
    for (const auto& o : ops_) total += o.weight;
    return ops_.at(op).weight / total;
}
