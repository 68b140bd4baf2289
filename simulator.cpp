// simulator.cpp
#include "simulator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace slatesim {

LoggedSlateSimulator::LoggedSlateSimulator(const SimulatorConfig& cfg)
  : cfg_(cfg), rng_(cfg.seed ^ 0x5EEDF00DULL) {
  if (cfg_.num_candidates < 1 || cfg_.slate_size < 1 || cfg_.slate_size > cfg_.num_candidates) {
    throw std::invalid_argument("SimulatorConfig: need 1 <= slate_size <= num_candidates");
  }
  if (cfg_.state_dim < 1 || cfg_.candidate_dim < 1) {
    throw std::invalid_argument("SimulatorConfig: feature dims must be >= 1");
  }
  if (!(cfg_.behavior_temperature > 0.0)) {
    throw std::invalid_argument("SimulatorConfig: behavior_temperature must be > 0");
  }
  if (cfg_.reward_noise < 0.0) {
    throw std::invalid_argument("SimulatorConfig: reward_noise must be >= 0");
  }

  const auto f32 = torch::TensorOptions().dtype(torch::kFloat32);

  // W ~ N(0, 1/state_dim) keeps c.Wx around unit scale
  w_ = torch::empty({cfg_.candidate_dim, cfg_.state_dim}, f32);
  fill_normal_(w_, 1.0 / std::sqrt((double)cfg_.state_dim));

  discount_ = torch::empty({cfg_.num_candidates}, f32);
  float* dp = discount_.data_ptr<float>();
  for (int64_t k = 0; k < cfg_.num_candidates; ++k) dp[k] = (float)(1.0 / std::log2((double)k + 2.0));
}

void LoggedSlateSimulator::fill_normal_(torch::Tensor& t, double stddev) {
  std::normal_distribution<double> nd(0.0, stddev);
  float* p = t.data_ptr<float>();
  const int64_t n = t.numel();
  for (int64_t i = 0; i < n; ++i) p[i] = (float)nd(rng_);
}

slaterl::RankingInput LoggedSlateSimulator::sample_contexts(int64_t batch) {
  if (batch < 1) throw std::invalid_argument("sample_contexts: batch must be >= 1");

  const auto f32 = torch::TensorOptions().dtype(torch::kFloat32);
  slaterl::RankingInput in;
  in.state_features = torch::empty({batch, cfg_.state_dim}, f32);
  in.src_seq_features = torch::empty({batch, cfg_.num_candidates, cfg_.candidate_dim}, f32);
  fill_normal_(in.state_features, 1.0);
  fill_normal_(in.src_seq_features, 1.0);
  return in;
}

torch::Tensor LoggedSlateSimulator::relevance(const slaterl::RankingInput& contexts) const {
  torch::NoGradGuard ng;
  auto state = contexts.state_features.to(torch::kCPU, torch::kFloat32);   // [B,S]
  auto cand = contexts.src_seq_features.to(torch::kCPU, torch::kFloat32);  // [B,N,C]
  auto proj = state.matmul(w_.t());                                        // [B,C]
  return torch::tanh(torch::bmm(cand, proj.unsqueeze(2)).squeeze(2));      // [B,N]
}

torch::Tensor LoggedSlateSimulator::slate_reward(const slaterl::RankingInput& contexts,
                                                 const torch::Tensor& slates) const {
  torch::NoGradGuard ng;
  auto rel = relevance(contexts);
  auto idx = slates.to(torch::kCPU, torch::kLong);
  if (idx.dim() != 2 || idx.size(0) != rel.size(0) || idx.size(1) > rel.size(1)) {
    throw std::invalid_argument("slate_reward: slates must be [B, K] with K <= num_candidates");
  }
  auto disc = discount_.slice(0, 0, idx.size(1)).unsqueeze(0); // [1,K]
  return (rel.gather(1, idx) * disc).sum(1);
}

torch::Tensor LoggedSlateSimulator::ideal_reward(const slaterl::RankingInput& contexts) const {
  torch::NoGradGuard ng;
  auto rel = relevance(contexts);
  auto top = std::get<0>(rel.topk(cfg_.slate_size, 1, /*largest=*/true, /*sorted=*/true));
  auto disc = discount_.slice(0, 0, cfg_.slate_size).unsqueeze(0);
  return (top * disc).sum(1);
}

torch::Tensor LoggedSlateSimulator::noisy_(torch::Tensor reward) {
  if (cfg_.reward_noise <= 0.0) return reward;
  reward = reward.contiguous().clone();
  std::normal_distribution<double> nd(0.0, cfg_.reward_noise);
  float* p = reward.data_ptr<float>();
  for (int64_t i = 0; i < reward.numel(); ++i) p[i] += (float)nd(rng_);
  return reward;
}

slaterl::RankingInput LoggedSlateSimulator::sample_logged_batch(int64_t batch) {
  auto in = sample_contexts(batch);
  auto rel = relevance(in).contiguous();

  const int64_t N = cfg_.num_candidates;
  const int64_t K = cfg_.slate_size;

  in.tgt_out_idx = torch::empty({batch, K}, torch::TensorOptions().dtype(torch::kLong));
  in.tgt_out_probs = torch::empty({batch}, torch::TensorOptions().dtype(torch::kFloat32));

  const float* rp = rel.data_ptr<float>();
  int64_t* ip = in.tgt_out_idx.data_ptr<int64_t>();
  float* pp = in.tgt_out_probs.data_ptr<float>();

  std::uniform_real_distribution<double> uni(0.0, 1.0);
  std::vector<double> logits((size_t)N);
  std::vector<double> w((size_t)N);
  std::vector<char> taken((size_t)N);

  // Plackett-Luce sampling without replacement, tracking the slate probability
  for (int64_t b = 0; b < batch; ++b) {
    for (int64_t j = 0; j < N; ++j) logits[(size_t)j] = (double)rp[b * N + j] / cfg_.behavior_temperature;
    std::fill(taken.begin(), taken.end(), 0);

    double prob = 1.0;
    for (int64_t t = 0; t < K; ++t) {
      double mx = -1e300;
      for (int64_t j = 0; j < N; ++j) if (!taken[(size_t)j]) mx = std::max(mx, logits[(size_t)j]);

      double z = 0.0;
      for (int64_t j = 0; j < N; ++j) {
        w[(size_t)j] = taken[(size_t)j] ? 0.0 : std::exp(logits[(size_t)j] - mx);
        z += w[(size_t)j];
      }

      const double u = uni(rng_) * z;
      double acc = 0.0;
      int64_t pick = -1;
      for (int64_t j = 0; j < N; ++j) {
        if (taken[(size_t)j]) continue;
        pick = j;                     // last available, covers rounding at the tail
        acc += w[(size_t)j];
        if (u < acc) break;
      }

      prob *= w[(size_t)pick] / z;
      taken[(size_t)pick] = 1;
      ip[b * K + t] = pick;
    }
    pp[b] = (float)prob;
  }

  in.slate_reward = noisy_(slate_reward(in, in.tgt_out_idx));
  return in;
}

slaterl::RankingInput LoggedSlateSimulator::sample_on_policy_batch(slaterl::SlatePolicy& policy,
                                                                   int64_t batch) {
  auto in = sample_contexts(batch);

  torch::Device device = torch::kCPU;
  const auto params = policy.parameters();
  if (!params.empty()) device = params.front().device();

  slaterl::DecodeOptions opts;
  opts.greedy = false;
  opts.slate_size = cfg_.slate_size;
  auto out = policy.forward(in.to(device), slaterl::Seq2SlateMode::Rank, opts);

  in.tgt_out_idx = out.ranked_idx.to(torch::kCPU);
  in.tgt_out_probs = out.ranked_probs.to(torch::kCPU, torch::kFloat32);
  in.slate_reward = noisy_(slate_reward(in, in.tgt_out_idx));
  return in;
}

} // namespace slatesim
