// rank.cpp
//
// Rank driver: decode slates with the current policy on simulator contexts and
// score them with the simulator's reward oracle.

#include "rank.h"

#include <iomanip>
#include <ostream>
#include <stdexcept>

namespace slateeval {

static torch::Device policy_device(slaterl::SlatePolicy& policy) {
  const auto params = policy.parameters();
  return params.empty() ? torch::Device(torch::kCPU) : params.front().device();
}

// Restores the module's train/eval flag on scope exit.
struct EvalModeGuard {
  torch::nn::Module& m;
  bool was_training;

  explicit EvalModeGuard(torch::nn::Module& mod) : m(mod), was_training(mod.is_training()) { m.eval(); }
  ~EvalModeGuard() { m.train(was_training); }
};

slatesim::EvalStats evaluate(slaterl::SlatePolicy& policy,
                             slatesim::LoggedSlateSimulator& sim,
                             int batches,
                             int64_t batch_size) {
  if (batches < 1 || batch_size < 1) throw std::invalid_argument("evaluate: batches and batch_size must be >= 1");

  EvalModeGuard guard(policy);
  const auto device = policy_device(policy);

  slaterl::DecodeOptions opts;
  opts.greedy = true;
  opts.slate_size = sim.config().slate_size;

  double sum_r = 0.0, sum_ideal = 0.0;
  int64_t n = 0;
  for (int i = 0; i < batches; ++i) {
    auto ctx = sim.sample_contexts(batch_size);
    auto out = policy.forward(ctx.to(device), slaterl::Seq2SlateMode::Rank, opts);
    sum_r += sim.slate_reward(ctx, out.ranked_idx).sum().item<double>();
    sum_ideal += sim.ideal_reward(ctx).sum().item<double>();
    n += batch_size;
  }

  slatesim::EvalStats st;
  st.mean_reward = sum_r / (double)n;
  st.mean_ideal_reward = sum_ideal / (double)n;
  return st;
}

RankResult rank(slaterl::SlatePolicy& policy,
                slatesim::LoggedSlateSimulator& sim,
                const RankConfig& cfg,
                std::ostream& os) {
  if (cfg.contexts < 1) throw std::invalid_argument("rank: contexts must be >= 1");

  EvalModeGuard guard(policy);
  const auto device = policy_device(policy);

  slaterl::DecodeOptions opts;
  opts.greedy = !cfg.sample;
  opts.temperature = cfg.temperature;
  opts.slate_size = sim.config().slate_size;

  auto ctx = sim.sample_contexts(cfg.contexts);
  auto out = policy.forward(ctx.to(device), slaterl::Seq2SlateMode::Rank, opts);

  auto slates = out.ranked_idx.to(torch::kCPU);
  auto probs = out.ranked_probs.to(torch::kCPU, torch::kDouble);
  auto reward = sim.slate_reward(ctx, slates).to(torch::kDouble);
  auto ideal = sim.ideal_reward(ctx).to(torch::kDouble);
  auto rel = sim.relevance(ctx);

  os << "=== slate ranking (" << (cfg.sample ? "sampled" : "greedy") << ") ===\n";
  os << std::fixed << std::setprecision(4);

  RankResult rr{};
  for (int b = 0; b < cfg.contexts; ++b) {
    os << "context " << b << ": slate=[";
    for (int64_t k = 0; k < slates.size(1); ++k) {
      const int64_t j = slates[b][k].item<int64_t>();
      os << (k ? " " : "") << j << "(" << rel[b][j].item<float>() << ")";
    }
    os << "] prob=" << probs[b].item<double>()
       << " reward=" << reward[b].item<double>()
       << " ideal=" << ideal[b].item<double>() << "\n";

    rr.mean_reward += reward[b].item<double>();
    rr.mean_ideal_reward += ideal[b].item<double>();
  }
  rr.contexts = cfg.contexts;
  rr.mean_reward /= (double)cfg.contexts;
  rr.mean_ideal_reward /= (double)cfg.contexts;

  os << "mean reward=" << rr.mean_reward << " mean ideal=" << rr.mean_ideal_reward << "\n";
  return rr;
}

} // namespace slateeval
