// model.cpp
#include "model.h"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace slaterl {

static constexpr float kNegInf = -std::numeric_limits<float>::infinity();

static void check_slates(const torch::Tensor& scores, const torch::Tensor& slates) {
  if (!slates.defined() || slates.dim() != 2) {
    throw std::invalid_argument("slates must be a [B, K] index tensor");
  }
  if (slates.size(0) != scores.size(0)) {
    throw std::invalid_argument("slates batch " + std::to_string(slates.size(0)) +
                                " != scores batch " + std::to_string(scores.size(0)));
  }
  const int64_t n = scores.size(1);
  const int64_t k = slates.size(1);
  if (k == 0 || k > n) {
    throw std::invalid_argument("slate length " + std::to_string(k) +
                                " not in [1, " + std::to_string(n) + "]");
  }
  if (slates.min().item<int64_t>() < 0 || slates.max().item<int64_t>() >= n) {
    throw std::invalid_argument("slate index out of range");
  }
  if (k > 1) {
    auto sorted = std::get<0>(slates.sort(1));
    if ((sorted.slice(1, 1) == sorted.slice(1, 0, k - 1)).any().item<bool>()) {
      throw std::invalid_argument("slate repeats a candidate");
    }
  }
}

torch::Tensor plackett_luce_log_prob(const torch::Tensor& scores, const torch::Tensor& slates) {
  check_slates(scores, slates);

  const auto slates_l = slates.to(torch::kLong);
  auto chosen = torch::zeros_like(scores, torch::TensorOptions().dtype(torch::kBool));
  auto lp = torch::zeros({scores.size(0)}, scores.options());

  for (int64_t t = 0; t < slates_l.size(1); ++t) {
    auto logp = torch::log_softmax(scores.masked_fill(chosen, kNegInf), 1); // [B,N]
    auto idx = slates_l.select(1, t).unsqueeze(1);                           // [B,1]
    lp = lp + logp.gather(1, idx).squeeze(1);
    chosen = chosen.scatter(1, idx, true);
  }
  return lp;
}

std::tuple<torch::Tensor, torch::Tensor> plackett_luce_decode(const torch::Tensor& scores,
                                                              int64_t k,
                                                              bool greedy) {
  if (k <= 0 || k > scores.size(1)) {
    throw std::invalid_argument("decode length " + std::to_string(k) +
                                " not in [1, " + std::to_string(scores.size(1)) + "]");
  }
  torch::NoGradGuard ng;

  auto chosen = torch::zeros_like(scores, torch::TensorOptions().dtype(torch::kBool));
  auto lp = torch::zeros({scores.size(0)}, scores.options());
  std::vector<torch::Tensor> cols;
  cols.reserve((size_t)k);

  for (int64_t t = 0; t < k; ++t) {
    auto logp = torch::log_softmax(scores.masked_fill(chosen, kNegInf), 1);
    auto idx = greedy ? logp.argmax(1, /*keepdim=*/true)
                      : torch::multinomial(logp.exp(), 1);
    lp = lp + logp.gather(1, idx).squeeze(1);
    chosen = chosen.scatter(1, idx, true);
    cols.push_back(idx);
  }
  return {torch::cat(cols, 1), lp};
}

// ---- PlackettLuceSlateNet ----
PlackettLuceSlateNetImpl::PlackettLuceSlateNetImpl(const SlateNetConfig& cfg)
    : fc1(cfg.state_dim + cfg.candidate_dim, cfg.hidden_dim),
      fc2(cfg.hidden_dim, cfg.hidden_dim),
      score(cfg.hidden_dim, 1),
      cfg_(cfg) {
  register_module("fc1", fc1);
  register_module("fc2", fc2);
  register_module("score", score);
}

torch::Tensor PlackettLuceSlateNetImpl::scores(const RankingInput& input) {
  const auto& state = input.state_features;   // [B,S]
  const auto& cand = input.src_seq_features;  // [B,N,C]
  if (!state.defined() || !cand.defined() || state.dim() != 2 || cand.dim() != 3) {
    throw std::invalid_argument("PlackettLuceSlateNet: expects state [B,S] and src_seq [B,N,C]");
  }
  if (state.size(1) != cfg_.state_dim || cand.size(2) != cfg_.candidate_dim) {
    throw std::invalid_argument("PlackettLuceSlateNet: feature dims do not match config");
  }

  const int64_t B = cand.size(0);
  const int64_t N = cand.size(1);
  auto x = torch::cat({state.unsqueeze(1).expand({B, N, state.size(1)}), cand}, 2);

  auto h = torch::relu(fc1(x));
  h = torch::relu(fc2(h));
  return score(h).squeeze(-1); // [B,N]
}

Seq2SlateOutput PlackettLuceSlateNetImpl::forward(const RankingInput& input,
                                                  Seq2SlateMode mode,
                                                  const DecodeOptions& opts) {
  if (opts.temperature <= 0.0) {
    throw std::invalid_argument("PlackettLuceSlateNet: temperature must be > 0");
  }

  Seq2SlateOutput out;
  if (mode == Seq2SlateMode::PerSeqLogProb) {
    auto s = scores(input);
    if (opts.temperature != 1.0) s = s / opts.temperature;
    out.log_probs = plackett_luce_log_prob(s, input.tgt_out_idx);
    return out;
  }

  torch::NoGradGuard ng;
  auto s = scores(input);
  if (opts.temperature != 1.0) s = s / opts.temperature;

  int64_t k = opts.slate_size;
  if (k <= 0) k = input.tgt_out_idx.defined() ? input.slate_size() : input.num_candidates();

  torch::Tensor lp;
  std::tie(out.ranked_idx, lp) = plackett_luce_decode(s, k, opts.greedy);
  out.ranked_probs = lp.exp();
  return out;
}

// ---- BaselineNet ----
BaselineNetImpl::BaselineNetImpl(int64_t state_dim, int64_t hidden_dim)
    : fc1(state_dim, hidden_dim),
      fc2(hidden_dim, hidden_dim),
      out(hidden_dim, 1) {
  register_module("fc1", fc1);
  register_module("fc2", fc2);
  register_module("out", out);
}

torch::Tensor BaselineNetImpl::forward(const RankingInput& input) {
  auto x = input.state_features;
  if (!x.defined() || x.dim() != 2) {
    throw std::invalid_argument("BaselineNet: expects state_features [B,S]");
  }
  auto h = torch::relu(fc1(x));
  h = torch::relu(fc2(h));
  return out(h); // [B,1]
}

} // namespace slaterl
