// trainer.h
#pragma once

#include "model.h"
#include "util/core/batch.h"
#include "util/logger.h"

#include <torch/torch.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace slaterl {

struct Seq2SlateParameters {
    bool on_policy = true;
};

struct TrainerConfig {
    int64_t minibatch_size = 1024;  // hint only, batches of any size are accepted
    bool use_gpu = false;
};

// Batch or collaborator output violates a train_step precondition.
class PreconditionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Off-policy importance weight would be undefined (behavior probability <= 0 or not finite).
class NumericAnomaly : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StepResult {
    torch::Tensor log_probs;   // [B] detached
    torch::Tensor advantage;   // [B] reward - baseline
    double rl_loss = 0.0;
    double baseline_loss = 0.0;
};

// REINFORCE trainer for a slate policy with a learned baseline.
//
// Each train_step() regresses the baseline on the observed slate reward, then
// takes one policy-gradient step using the (detached) baseline as control
// variate. Off-policy batches are reweighted by pi(slate) / behavior(slate).
//
// Not thread-safe: train_step() mutates optimizer and gradient state and must
// not be called concurrently.
class Seq2SlateTrainer {
public:
    static constexpr double kLearningRate = 1e-3;

    Seq2SlateTrainer(std::shared_ptr<SlatePolicy> policy,
                     std::shared_ptr<SlateBaseline> baseline,
                     const Seq2SlateParameters& params,
                     const TrainerConfig& cfg,
                     std::shared_ptr<LogSink> logger);

    // Throws PreconditionError / NumericAnomaly before touching any state.
    StepResult train_step(const RankingInput& batch);

    // Components that can be restored from a checkpoint by warm_start().
    static const std::vector<std::string>& warm_start_components();

    // Save/load full checkpoint (networks + optimizers + step counter)
    void save_checkpoint(const std::string& path);
    bool load_checkpoint(const std::string& path);

    // Load only the named networks' parameters. Returns false if path does not exist.
    bool warm_start(const std::string& path,
                    const std::vector<std::string>& components = warm_start_components());

    SlatePolicy& policy() { return *policy_; }
    SlateBaseline& baseline() { return *baseline_; }
    torch::optim::Adam& policy_optimizer() { return *policy_opt_; }
    torch::optim::Adam& baseline_optimizer() { return *baseline_opt_; }

    std::uint64_t step_counter() const { return step_counter_; }
    bool on_policy() const { return params_.on_policy; }
    const TrainerConfig& config() const { return cfg_; }
    torch::Device device() const { return device_; }

private:
    std::shared_ptr<LogSink> logger_;

    std::shared_ptr<SlatePolicy> policy_;
    std::shared_ptr<SlateBaseline> baseline_;
    const Seq2SlateParameters params_;
    const TrainerConfig cfg_;
    torch::Device device_;

    std::unique_ptr<torch::optim::Adam> policy_opt_;
    std::unique_ptr<torch::optim::Adam> baseline_opt_;

    std::uint64_t step_counter_ = 0;

    void check_batch_(const RankingInput& batch) const;
    torch::Tensor importance_weight_(const RankingInput& batch, const torch::Tensor& log_probs) const;
    torch::nn::Module& component_(const std::string& name);
};

} // namespace slaterl
