#pragma once
#include "LNSSolver.h"
#include "OperatorSelector.h"

// Adaptive LNS: random or Shaw removal, best or regret-k insertion, each pair
// chosen by roulette over weights that follow the rewards the driver hands out.
class AdaptiveLNS : public LNSSolver {
public:
    enum DestroyOp { kRandomRemoval = 0, kShawRemoval = 1 };
    enum RepairOp { kBestInsertion = 0, kRegretInsertion = 1 };

    AdaptiveLNS(std::shared_ptr<const VRPInstance> instance, const Solution& initial_solution,
                const SolveParams& params, std::mt19937& gen, int verbose = 0);

    void update_scores(double delta) override;
    void update_weights() override;
    const char* name() const override { return "ALNS"; }

    const OperatorSelector& destroy_ops() const { return destroy_ops_; }
    const OperatorSelector& repair_ops() const { return repair_ops_; }

protected:
    RemovedStops destroy() override;
    bool repair(const RemovedStops& removed, std::vector<int>& routes_used) override;

private:
    OperatorSelector destroy_ops_;
    OperatorSelector repair_ops_;
    int last_destroy_op_ = -1;
};
