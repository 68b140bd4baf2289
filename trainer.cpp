// trainer.cpp
// REINFORCE-with-baseline trainer for slate policies using libtorch.
#include "trainer.h"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace slaterl {

static torch::Device select_device(bool use_gpu) {
  return (use_gpu && torch::cuda::is_available()) ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
}

static std::string shape_str(const torch::Tensor& t) {
  if (!t.defined()) return "<undefined>";
  std::ostringstream oss;
  oss << t.sizes();
  return oss.str();
}

// True if any parameter tensor is registered in both modules.
static bool shares_parameters(const torch::nn::Module& a, const torch::nn::Module& b) {
  std::unordered_set<const void*> seen;
  for (const auto& p : a.parameters()) seen.insert(p.unsafeGetTensorImpl());
  for (const auto& p : b.parameters()) {
    if (seen.count(p.unsafeGetTensorImpl())) return true;
  }
  return false;
}

Seq2SlateTrainer::Seq2SlateTrainer(std::shared_ptr<SlatePolicy> policy,
                                   std::shared_ptr<SlateBaseline> baseline,
                                   const Seq2SlateParameters& params,
                                   const TrainerConfig& cfg,
                                   std::shared_ptr<LogSink> logger)
  : logger_(std::move(logger)),
    policy_(std::move(policy)),
    baseline_(std::move(baseline)),
    params_(params),
    cfg_(cfg),
    device_(select_device(cfg.use_gpu)) {

  if (!policy_) throw std::invalid_argument("Seq2SlateTrainer: policy is null");
  if (!baseline_) throw std::invalid_argument("Seq2SlateTrainer: baseline is null");
  if (!logger_) throw std::invalid_argument("Seq2SlateTrainer: logger is null");
  if (shares_parameters(*policy_, *baseline_)) {
    throw std::invalid_argument("Seq2SlateTrainer: policy and baseline share parameters");
  }

  if (cfg_.use_gpu && !device_.is_cuda()) {
    logf(*logger_, "CUDA requested but not available; trainer uses CPU.");
  }

  policy_->to(device_);
  baseline_->to(device_);
  policy_->train();
  baseline_->train();

  // One optimizer per network, never crossing parameter sets.
  policy_opt_ = std::make_unique<torch::optim::Adam>(
      policy_->parameters(), torch::optim::AdamOptions(kLearningRate).amsgrad(true));
  baseline_opt_ = std::make_unique<torch::optim::Adam>(
      baseline_->parameters(), torch::optim::AdamOptions(kLearningRate).amsgrad(true));
}

const std::vector<std::string>& Seq2SlateTrainer::warm_start_components() {
  static const std::vector<std::string> components = {"policy_network", "baseline_network"};
  return components;
}

void Seq2SlateTrainer::check_batch_(const RankingInput& batch) const {
  const auto& reward = batch.slate_reward;
  if (!reward.defined()) {
    throw PreconditionError("train_step: slate_reward is required");
  }

  const int64_t batch_size = batch.batch_size();
  if (batch.state_features.dim() != 2 || batch_size < 1) {
    throw PreconditionError("train_step: state_features must be [B, state_dim] with B >= 1, got " +
                            shape_str(batch.state_features));
  }
  if (reward.dim() != 1 || reward.size(0) != batch_size) {
    throw PreconditionError("train_step: slate_reward shape " + shape_str(reward) +
                            " does not match batch size " + std::to_string(batch_size));
  }

  if (!params_.on_policy) {
    const auto& probs = batch.tgt_out_probs;
    if (!probs.defined()) {
      throw PreconditionError("train_step: off-policy training requires tgt_out_probs");
    }
    if (probs.dim() != 1 || probs.size(0) != batch_size) {
      throw PreconditionError("train_step: tgt_out_probs shape " + shape_str(probs) +
                              " does not match batch size " + std::to_string(batch_size));
    }
    const bool ok = (torch::isfinite(probs) & (probs > 0)).all().item<bool>();
    if (!ok) {
      throw NumericAnomaly("train_step: tgt_out_probs must be finite and > 0");
    }
  }
}

torch::Tensor Seq2SlateTrainer::importance_weight_(const RankingInput& batch,
                                                   const torch::Tensor& log_probs) const {
  if (params_.on_policy) {
    // tgt_out_probs is ignored on-policy
    return torch::ones({1}, torch::TensorOptions().dtype(torch::kFloat32).device(device_));
  }
  return torch::exp(log_probs.detach()) / batch.tgt_out_probs;
}

StepResult Seq2SlateTrainer::train_step(const RankingInput& batch) {
  const auto t1 = std::chrono::steady_clock::now();

  check_batch_(batch);

  const auto& reward = batch.slate_reward;
  const double batch_size = (double)batch.batch_size();

  // ---- Forward both networks ----
  // Everything that can fail runs before the first optimizer step. The
  // parameter sets are disjoint, so the policy forward is unaffected by the
  // baseline update that follows.
  auto b = baseline_->forward(batch);
  if (b.dim() == 2 && b.size(1) == 1) b = b.squeeze(1);
  if (!b.sizes().equals(reward.sizes())) {
    throw PreconditionError("train_step: baseline output " + shape_str(b) +
                            " does not match slate_reward " + shape_str(reward));
  }
  if (!b.requires_grad()) {
    throw PreconditionError("train_step: baseline output does not require grad");
  }
  auto baseline_loss = (b - reward).pow(2).sum() / batch_size;

  // log probs of the logged (target) slates
  auto log_probs = policy_->forward(batch, Seq2SlateMode::PerSeqLogProb).log_probs;
  auto b_detached = b.detach();
  if (!log_probs.defined() || !log_probs.sizes().equals(reward.sizes())) {
    throw PreconditionError("train_step: log_probs " + shape_str(log_probs) +
                            " does not match slate_reward " + shape_str(reward));
  }
  if (b_detached.requires_grad() || !log_probs.requires_grad()) {
    throw PreconditionError("train_step: baseline must be detached and log_probs must require grad");
  }

  auto importance_sampling = importance_weight_(batch, log_probs);

  // ---- Baseline regression ----
  baseline_opt_->zero_grad();
  baseline_loss.backward();
  baseline_opt_->step();

  // ---- REINFORCE ----
  // Negative sign: gradient descent on -E[reward].
  auto batch_loss = -importance_sampling * log_probs * (reward - b_detached);
  auto rl_loss = batch_loss.sum() / batch_size;

  policy_opt_->zero_grad();
  rl_loss.backward();
  policy_opt_->step();

  StepResult res;
  res.rl_loss = rl_loss.detach().item<double>();
  res.baseline_loss = baseline_loss.detach().item<double>();
  res.advantage = reward - b_detached;
  res.log_probs = log_probs.detach();

  ++step_counter_;
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t1).count();
  logf(*logger_,
       "step=", step_counter_,
       " rl_loss=", res.rl_loss,
       " baseline_loss=", res.baseline_loss,
       " elapsed_seconds=", elapsed);

  return res;
}

torch::nn::Module& Seq2SlateTrainer::component_(const std::string& name) {
  if (name == "policy_network") return *policy_;
  if (name == "baseline_network") return *baseline_;
  throw std::invalid_argument("unknown warm start component: " + name);
}

void Seq2SlateTrainer::save_checkpoint(const std::string& path) {
  torch::serialize::OutputArchive arch;

  torch::serialize::OutputArchive policy_arch, baseline_arch, policy_opt_arch, baseline_opt_arch;
  policy_->save(policy_arch);
  baseline_->save(baseline_arch);
  policy_opt_->save(policy_opt_arch);
  baseline_opt_->save(baseline_opt_arch);

  arch.write("policy_network", policy_arch);
  arch.write("baseline_network", baseline_arch);
  arch.write("policy_optimizer", policy_opt_arch);
  arch.write("baseline_optimizer", baseline_opt_arch);

  auto ts = torch::tensor((int64_t)step_counter_, torch::TensorOptions().dtype(torch::kInt64));
  arch.write("train_step", ts);

  arch.save_to(path);
  logf(*logger_, "Saved checkpoint: ", path, " (train_step=", step_counter_, ")");
}

bool Seq2SlateTrainer::load_checkpoint(const std::string& path) {
  if (!fs::exists(path)) return false;

  torch::serialize::InputArchive arch;
  arch.load_from(path, device_);

  torch::serialize::InputArchive policy_arch, baseline_arch, policy_opt_arch, baseline_opt_arch;
  arch.read("policy_network", policy_arch);
  arch.read("baseline_network", baseline_arch);
  arch.read("policy_optimizer", policy_opt_arch);
  arch.read("baseline_optimizer", baseline_opt_arch);

  policy_->load(policy_arch);
  baseline_->load(baseline_arch);
  policy_opt_->load(policy_opt_arch);
  baseline_opt_->load(baseline_opt_arch);

  torch::Tensor ts;
  if (arch.try_read("train_step", ts)) {
    step_counter_ = (std::uint64_t)ts.item<int64_t>();
  } else {
    step_counter_ = 0;
  }

  policy_->to(device_);
  baseline_->to(device_);
  policy_->train();
  baseline_->train();

  logf(*logger_, "Loaded checkpoint: ", path, " (train_step=", step_counter_, ")");
  return true;
}

bool Seq2SlateTrainer::warm_start(const std::string& path, const std::vector<std::string>& components) {
  // Resolve names first so a typo loads nothing.
  std::vector<torch::nn::Module*> modules;
  for (const auto& name : components) modules.push_back(&component_(name));

  if (!fs::exists(path)) return false;

  torch::serialize::InputArchive arch;
  arch.load_from(path, device_);

  for (size_t i = 0; i < components.size(); ++i) {
    torch::serialize::InputArchive sub;
    arch.read(components[i], sub);
    modules[i]->load(sub);
    modules[i]->to(device_);
    logf(*logger_, "Warm start: ", components[i], " <- ", path);
  }
  return true;
}

} // namespace slaterl
