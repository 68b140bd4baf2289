// batch.h
#pragma once

#include <torch/torch.h>

#include <cstdint>

namespace slaterl {

// One minibatch of logged ranking episodes.
//
// Shapes (B = batch, N = candidates per episode, K = slate length):
//   state_features    [B, state_dim]      float
//   src_seq_features  [B, N, cand_dim]    float
//   tgt_out_idx       [B, K]              int64, positions into src_seq
//   slate_reward      [B]                 float, required (undefined = absent)
//   tgt_out_probs     [B]                 float, behavior policy probability
//                                         of the logged slate (off-policy only)
struct RankingInput {
    torch::Tensor state_features;
    torch::Tensor src_seq_features;
    torch::Tensor tgt_out_idx;
    torch::Tensor slate_reward;
    torch::Tensor tgt_out_probs;

    int64_t batch_size() const {
        return state_features.defined() && state_features.dim() > 0 ? state_features.size(0) : 0;
    }
    int64_t num_candidates() const { return src_seq_features.defined() ? src_seq_features.size(1) : 0; }
    int64_t slate_size() const { return tgt_out_idx.defined() ? tgt_out_idx.size(1) : 0; }

    RankingInput to(torch::Device device) const {
        auto mv = [&](const torch::Tensor& t) {
            return t.defined() ? t.to(device, /*non_blocking=*/device.is_cuda()) : t;
        };
        RankingInput out;
        out.state_features   = mv(state_features);
        out.src_seq_features = mv(src_seq_features);
        out.tgt_out_idx      = mv(tgt_out_idx);
        out.slate_reward     = mv(slate_reward);
        out.tgt_out_probs    = mv(tgt_out_probs);
        return out;
    }
};

} // namespace slaterl
