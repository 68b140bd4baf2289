// rank.h
#pragma once

#include <cstdint>
#include <iosfwd>
#include <torch/torch.h>

#include "model.h"
#include "simulator.h"

namespace slateeval {

    struct RankConfig {
        int contexts = 4;
        bool sample = false;        // false = greedy decode
        double temperature = 1.0;   // only used when sampling
    };

    struct RankResult {
        double mean_reward = 0.0;
        double mean_ideal_reward = 0.0;
        int contexts = 0;
    };

    // Greedy slates on `batches` x `batch_size` fresh contexts.
    slatesim::EvalStats evaluate(slaterl::SlatePolicy& policy,
                                 slatesim::LoggedSlateSimulator& sim,
                                 int batches,
                                 int64_t batch_size);

    // Rank a few sampled contexts and print each slate with its reward.
    RankResult rank(slaterl::SlatePolicy& policy,
                    slatesim::LoggedSlateSimulator& sim,
                    const RankConfig& cfg,
                    std::ostream& os);

} // namespace slateeval
