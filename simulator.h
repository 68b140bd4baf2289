// simulator.h
#pragma once

#include "model.h"
#include "util/core/batch.h"

#include <torch/torch.h>

#include <cstdint>
#include <random>

namespace slatesim {

struct SimulatorConfig {
    int64_t num_candidates = 10;
    int64_t slate_size = 5;
    int64_t state_dim = 8;
    int64_t candidate_dim = 8;

    // Behavior policy: Plackett-Luce over relevance / behavior_temperature.
    // Larger => closer to uniform.
    double behavior_temperature = 2.0;

    double reward_noise = 0.0;  // stddev of Gaussian noise added to slate reward

    std::uint64_t seed = 1;
};

struct EvalStats {
    double mean_reward = 0.0;
    double mean_ideal_reward = 0.0;
};

// Synthetic ranking episodes with a hidden relevance model:
//   rel_j = tanh(c_j . W x)
//   reward(y) = sum_k rel_{y_k} / log2(k + 2)
class LoggedSlateSimulator {
public:
    explicit LoggedSlateSimulator(const SimulatorConfig& cfg);

    const SimulatorConfig& config() const { return cfg_; }

    // Fresh contexts only: state_features + src_seq_features.
    slaterl::RankingInput sample_contexts(int64_t batch);

    // Contexts + slates logged by the behavior policy, with reward and tgt_out_probs.
    slaterl::RankingInput sample_logged_batch(int64_t batch);

    // Contexts + slates sampled from `policy`; tgt_out_probs = policy probability.
    slaterl::RankingInput sample_on_policy_batch(slaterl::SlatePolicy& policy, int64_t batch);

    // [B, N] hidden relevance
    torch::Tensor relevance(const slaterl::RankingInput& contexts) const;

    // Noise-free reward of slates [B, K] -> [B]
    torch::Tensor slate_reward(const slaterl::RankingInput& contexts, const torch::Tensor& slates) const;

    // Best achievable noise-free reward (top-K by relevance) -> [B]
    torch::Tensor ideal_reward(const slaterl::RankingInput& contexts) const;

private:
    SimulatorConfig cfg_;
    std::mt19937_64 rng_;
    torch::Tensor w_;         // [candidate_dim, state_dim]
    torch::Tensor discount_;  // [num_candidates], 1 / log2(k + 2)

    void fill_normal_(torch::Tensor& t, double stddev);
    torch::Tensor noisy_(torch::Tensor reward);
};

} // namespace slatesim
