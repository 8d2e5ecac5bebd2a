#pragma once
#include <deque>
#include <random>
#include <vector>

// Partition of customers 1..num_customers-1 into a bounded FIFO of recently
// removed customers and the pool still eligible for removal.
class TabuPool {
public:
    explicit TabuPool(int num_customers);

    // FIFO bound: num_customers / 10.
    int bound() const { return bound_; }
    int eligible_count() const { return (int)not_tabu_.size(); }
    const std::vector<int>& eligible() const { return not_tabu_; }
    const std::deque<int>& tabu() const { return tabu_; }
    bool is_eligible(int cust_no) const { return position_[cust_no] != -1; }

    // Removes and returns a uniformly chosen eligible customer (swap-remove).
    // Precondition: eligible_count() > 0.
    int take_random(std::mt19937& gen);
    // Removes a specific eligible customer; false when it is not eligible.
    bool take(int cust_no);

    // Queues customers taken by the last destroy, then releases the oldest
    // entries back to the eligible pool while the queue exceeds the bound.
    void push_tabu(const std::vector<int>& cust_nos);

    // Everything eligible again, queue empty.
    void reset();

    // Tabu and eligible sets are disjoint and cover every customer.
    bool is_consistent() const;

private:
    void make_eligible(int cust_no);

    int num_customers_;
    int bound_;
    std::deque<int> tabu_;
    std::vector<int> not_tabu_;
    std::vector<int> position_; // index into not_tabu_, -1 when not eligible
};
