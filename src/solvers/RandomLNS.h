#pragma once
#include "LNSSolver.h"

// Random removal followed by best insertion, no operator adaptation.
class RandomLNS : public LNSSolver {
public:
    using LNSSolver::LNSSolver;
    const char* name() const override { return "LNS"; }

protected:
    RemovedStops destroy() override {
        return operators::remove_random(current_, tabu_, params_.destroy_size, gen_);
    }
    bool repair(const RemovedStops& removed, std::vector<int>& routes_used) override {
        return operators::reinsert_best(current_, removed, params_.insertion_noise, gen_, &routes_used);
    }
};
