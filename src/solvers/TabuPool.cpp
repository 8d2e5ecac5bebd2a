#include "TabuPool.h"
#include <stdexcept>

TabuPool::TabuPool(int num_customers)
    : num_customers_(num_customers), bound_(num_customers / 10), position_(num_customers, -1) {
    reset();
}

void TabuPool::make_eligible(int cust_no) {
    position_[cust_no] = (int)not_tabu_.size();
    not_tabu_.push_back(cust_no);
}

int TabuPool::take_random(std::mt19937& gen) {
    if (not_tabu_.empty()) throw std::logic_error("take_random on an empty eligible pool");
    std::uniform_int_distribution<> pick(0, (int)not_tabu_.size() - 1);
    int cust_no = not_tabu_[pick(gen)];
    take(cust_no);
    return cust_no;
}

bool TabuPool::take(int cust_no) {
    if (cust_no <= 0 || cust_no >= num_customers_) return false;
    int idx = position_[cust_no];
    if (idx == -1) return false;
    int moved = not_tabu_.back();
    not_tabu_[idx] = moved;
    position_[moved] = idx;
    not_tabu_.pop_back();
    position_[cust_no] = -1;
    return true;
}

void TabuPool::push_tabu(const std::vector<int>& cust_nos) {
    for (int c : cust_nos) tabu_.push_back(c);
    while ((int)tabu_.size() > bound_) {
        int allowed = tabu_.front();
        tabu_.pop_front();
        make_eligible(allowed);
    }
}

void TabuPool::reset() {
    tabu_.clear();
    not_tabu_.clear();
    not_tabu_.reserve(num_customers_ > 0 ? num_customers_ - 1 : 0);
    for (int c = 1; c < num_customers_; ++c) make_eligible(c);
}

bool TabuPool::is_consistent() const {
    std::vector<int> seen(num_customers_, 0);
    for (int c : tabu_) {
        if (c <= 0 || c >= num_customers_ || position_[c] != -1) return false;
        ++seen[c];
    }
    for (int i = 0; i < (int)not_tabu_.size(); ++i) {
        int c = not_tabu_[i];
        if (c <= 0 || c >= num_customers_ || position_[c] != i) return false;
        ++seen[c];
    }
    for (int c = 1; c < num_customers_; ++c) {
        if (seen[c] != 1) return false;
    }
    return true;
}
